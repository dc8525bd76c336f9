// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "ConfigLoader.hh"

#include <fstream>
#include <iterator>
#include <boost/outcome/try.hpp>

#include "relpack/Errors.hh"

namespace relpack
{
  outcome::std_result<PipelineConfig> ConfigLoader::load_from_file(const std::filesystem::path &file_path)
  {
    if (!std::filesystem::exists(file_path))
      {
        logger_->error("File does not exist: {}", file_path.string());
        return PipelineError::InvalidConfiguration;
      }

    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open())
      {
        logger_->error("Failed to open file: {}", file_path.string());
        return PipelineError::InvalidConfiguration;
      }

    std::string json_content;
    try
      {
        json_content.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
      }
    catch (const std::exception &e)
      {
        logger_->error("Error while reading file: {}: {}", file_path.string(), e.what());
        return PipelineError::InvalidConfiguration;
      }

    if (file.bad())
      {
        logger_->error("Error while reading file: {}", file_path.string());
        return PipelineError::InvalidConfiguration;
      }

    return load_from_json(json_content);
  }

  outcome::std_result<PipelineConfig> ConfigLoader::load_from_json(const std::string &json_content)
  {
    boost::system::error_code ec;
    boost::json::value parsed = boost::json::parse(json_content, ec);
    if (ec)
      {
        logger_->error("Failed to parse configuration JSON: {}", ec.message());
        return PipelineError::InvalidConfiguration;
      }

    if (!parsed.is_object())
      {
        logger_->error("Configuration JSON root is not an object");
        return PipelineError::InvalidConfiguration;
      }

    const auto &root = parsed.as_object();
    PipelineConfig config;

    using Parser = outcome::std_result<void> (ConfigLoader::*)(const boost::json::object &, PipelineConfig &);
    const Parser parsers[] = {
      &ConfigLoader::parse_product,
      &ConfigLoader::parse_builder,
      &ConfigLoader::parse_credentials,
      &ConfigLoader::parse_poll,
      &ConfigLoader::parse_notarization,
      &ConfigLoader::parse_publish,
      &ConfigLoader::parse_validation,
      &ConfigLoader::parse_tools,
    };

    for (auto parser: parsers)
      {
        auto result = (this->*parser)(root, config);
        if (!result)
          {
            return result.error();
          }
      }

    return config;
  }

  outcome::std_result<void> ConfigLoader::parse_product(const boost::json::object &root, PipelineConfig &config)
  {
    auto product = section(root, "product");
    if (!product)
      {
        return product.error();
      }
    if (product.value() == nullptr)
      {
        return outcome::success();
      }

    const auto &obj = *product.value();
    BOOST_OUTCOME_TRYV(read_string(obj, "product", "name", config.product.name));
    BOOST_OUTCOME_TRYV(read_string(obj, "product", "version", config.product.version));
    BOOST_OUTCOME_TRYV(read_string(obj, "product", "arch", config.product.arch));

    if (config.product.name.empty())
      {
        logger_->error("product.name must not be empty");
        return PipelineError::InvalidConfiguration;
      }
    return outcome::success();
  }

  outcome::std_result<void> ConfigLoader::parse_builder(const boost::json::object &root, PipelineConfig &config)
  {
    auto builder = section(root, "builder");
    if (!builder)
      {
        return builder.error();
      }
    if (builder.value() == nullptr)
      {
        return outcome::success();
      }

    const auto &obj = *builder.value();

    if (const auto *it = obj.find("command"); it != obj.end())
      {
        if (!it->value().is_array())
          {
            logger_->error("builder.command must be an array, got: {}", boost::json::serialize(it->value()));
            return PipelineError::InvalidConfiguration;
          }

        std::vector<std::string> command;
        for (const auto &element: it->value().as_array())
          {
            if (!element.is_string())
              {
                logger_->error("builder.command array element must be a string, got: {}", boost::json::serialize(element));
                return PipelineError::InvalidConfiguration;
              }
            command.emplace_back(element.as_string());
          }

        if (command.empty())
          {
            logger_->error("builder.command must not be empty");
            return PipelineError::InvalidConfiguration;
          }
        config.builder.command = std::move(command);
      }

    BOOST_OUTCOME_TRYV(read_path(obj, "builder", "working_directory", config.builder.working_directory));
    BOOST_OUTCOME_TRYV(read_path(obj, "builder", "output_root", config.builder.output_root));
    BOOST_OUTCOME_TRYV(read_bool(obj, "builder", "produces_disk_image", config.builder.produces_disk_image));
    BOOST_OUTCOME_TRYV(read_seconds(obj, "builder", "terminate_grace_seconds", config.builder.terminate_grace));

    if (obj.contains("bundle_path"))
      {
        std::filesystem::path bundle_path;
        BOOST_OUTCOME_TRYV(read_path(obj, "builder", "bundle_path", bundle_path));
        config.builder.bundle_path = bundle_path;
      }

    if (obj.contains("artifact_path"))
      {
        std::filesystem::path artifact_path;
        BOOST_OUTCOME_TRYV(read_path(obj, "builder", "artifact_path", artifact_path));
        config.builder.artifact_path = artifact_path;
      }

    return outcome::success();
  }

  outcome::std_result<void> ConfigLoader::parse_credentials(const boost::json::object &root, PipelineConfig &config)
  {
    auto credentials = section(root, "credentials");
    if (!credentials)
      {
        return credentials.error();
      }
    if (credentials.value() == nullptr)
      {
        return outcome::success();
      }

    const auto &obj = *credentials.value();

    if (const auto *it = obj.find("env_file"); it != obj.end())
      {
        if (it->value().is_null())
          {
            config.credentials.env_file.reset();
          }
        else if (it->value().is_string())
          {
            std::string env_file(it->value().as_string());
            if (env_file.empty())
              {
                config.credentials.env_file.reset();
              }
            else
              {
                config.credentials.env_file = env_file;
              }
          }
        else
          {
            logger_->error("credentials.env_file must be a string or null, got: {}", boost::json::serialize(it->value()));
            return PipelineError::InvalidConfiguration;
          }
      }

    BOOST_OUTCOME_TRYV(read_string(obj, "credentials", "identity_class", config.credentials.identity_class));
    return outcome::success();
  }

  outcome::std_result<void> ConfigLoader::parse_poll(const boost::json::object &root, PipelineConfig &config)
  {
    auto poll = section(root, "poll");
    if (!poll)
      {
        return poll.error();
      }
    if (poll.value() == nullptr)
      {
        return outcome::success();
      }

    const auto &obj = *poll.value();
    BOOST_OUTCOME_TRYV(read_seconds(obj, "poll", "interval_seconds", config.poll.interval));
    BOOST_OUTCOME_TRYV(read_seconds(obj, "poll", "deadline_seconds", config.poll.deadline));
    BOOST_OUTCOME_TRYV(read_seconds(obj, "poll", "heartbeat_seconds", config.poll.heartbeat));

    if (config.poll.interval > config.poll.deadline)
      {
        logger_->error("poll.interval_seconds ({}) exceeds poll.deadline_seconds ({})", config.poll.interval.count(), config.poll.deadline.count());
        return PipelineError::InvalidConfiguration;
      }
    return outcome::success();
  }

  outcome::std_result<void> ConfigLoader::parse_notarization(const boost::json::object &root, PipelineConfig &config)
  {
    auto notarization = section(root, "notarization");
    if (!notarization)
      {
        return notarization.error();
      }
    if (notarization.value() == nullptr)
      {
        return outcome::success();
      }

    const auto &obj = *notarization.value();
    BOOST_OUTCOME_TRYV(read_bool(obj, "notarization", "enabled", config.notarization.enabled));
    BOOST_OUTCOME_TRYV(read_string(obj, "notarization", "acceptance_marker", config.notarization.acceptance_marker));
    BOOST_OUTCOME_TRYV(read_seconds(obj, "notarization", "staple_grace_seconds", config.notarization.staple_grace));
    BOOST_OUTCOME_TRYV(read_seconds(obj, "notarization", "staple_backoff_seconds", config.notarization.staple_backoff));

    if (const auto *it = obj.find("staple_attempts"); it != obj.end())
      {
        if (!it->value().is_int64() || it->value().as_int64() < 1)
          {
            logger_->error("notarization.staple_attempts must be a positive integer, got: {}", boost::json::serialize(it->value()));
            return PipelineError::InvalidConfiguration;
          }
        config.notarization.staple_attempts = static_cast<int>(it->value().as_int64());
      }

    if (config.notarization.acceptance_marker.empty())
      {
        logger_->error("notarization.acceptance_marker must not be empty");
        return PipelineError::InvalidConfiguration;
      }
    return outcome::success();
  }

  outcome::std_result<void> ConfigLoader::parse_publish(const boost::json::object &root, PipelineConfig &config)
  {
    auto publish = section(root, "publish");
    if (!publish)
      {
        return publish.error();
      }
    if (publish.value() == nullptr)
      {
        return outcome::success();
      }

    return read_path(*publish.value(), "publish", "directory", config.publish_directory);
  }

  outcome::std_result<void> ConfigLoader::parse_validation(const boost::json::object &root, PipelineConfig &config)
  {
    auto validation = section(root, "validation");
    if (!validation)
      {
        return validation.error();
      }
    if (validation.value() == nullptr)
      {
        return outcome::success();
      }

    return read_bool(*validation.value(), "validation", "reject_stale_artifacts", config.reject_stale_artifacts);
  }

  outcome::std_result<void> ConfigLoader::parse_tools(const boost::json::object &root, PipelineConfig &config)
  {
    auto tools = section(root, "tools");
    if (!tools)
      {
        return tools.error();
      }
    if (tools.value() == nullptr)
      {
        return outcome::success();
      }

    const auto &obj = *tools.value();
    BOOST_OUTCOME_TRYV(read_string(obj, "tools", "xcrun", config.tools.xcrun));
    BOOST_OUTCOME_TRYV(read_string(obj, "tools", "codesign", config.tools.codesign));
    BOOST_OUTCOME_TRYV(read_string(obj, "tools", "spctl", config.tools.spctl));
    BOOST_OUTCOME_TRYV(read_string(obj, "tools", "security", config.tools.security));
    BOOST_OUTCOME_TRYV(read_string(obj, "tools", "hdiutil", config.tools.hdiutil));
    return outcome::success();
  }

  // =============================================================================
  // Field readers
  // =============================================================================

  outcome::std_result<const boost::json::object *> ConfigLoader::section(const boost::json::object &root, const char *name)
  {
    const auto *it = root.find(name);
    if (it == root.end())
      {
        return static_cast<const boost::json::object *>(nullptr);
      }

    if (!it->value().is_object())
      {
        logger_->error("{} must be an object, got: {}", name, boost::json::serialize(it->value()));
        return PipelineError::InvalidConfiguration;
      }
    return &it->value().as_object();
  }

  outcome::std_result<void> ConfigLoader::read_string(const boost::json::object &obj, const std::string &prefix, const char *key, std::string &target)
  {
    if (const auto *it = obj.find(key); it != obj.end())
      {
        if (!it->value().is_string())
          {
            logger_->error("{}.{} must be a string, got: {}", prefix, key, boost::json::serialize(it->value()));
            return PipelineError::InvalidConfiguration;
          }
        target = std::string(it->value().as_string());
      }
    return outcome::success();
  }

  outcome::std_result<void> ConfigLoader::read_path(const boost::json::object &obj,
                                                    const std::string &prefix,
                                                    const char *key,
                                                    std::filesystem::path &target)
  {
    std::string value = target.string();
    BOOST_OUTCOME_TRYV(read_string(obj, prefix, key, value));
    if (value.empty())
      {
        logger_->error("{}.{} must not be empty", prefix, key);
        return PipelineError::InvalidConfiguration;
      }
    target = value;
    return outcome::success();
  }

  outcome::std_result<void> ConfigLoader::read_bool(const boost::json::object &obj, const std::string &prefix, const char *key, bool &target)
  {
    if (const auto *it = obj.find(key); it != obj.end())
      {
        if (!it->value().is_bool())
          {
            logger_->error("{}.{} must be a boolean, got: {}", prefix, key, boost::json::serialize(it->value()));
            return PipelineError::InvalidConfiguration;
          }
        target = it->value().as_bool();
      }
    return outcome::success();
  }

  outcome::std_result<void> ConfigLoader::read_seconds(const boost::json::object &obj,
                                                       const std::string &prefix,
                                                       const char *key,
                                                       std::chrono::seconds &target)
  {
    if (const auto *it = obj.find(key); it != obj.end())
      {
        if (!it->value().is_int64() || it->value().as_int64() <= 0)
          {
            logger_->error("{}.{} must be a positive integer, got: {}", prefix, key, boost::json::serialize(it->value()));
            return PipelineError::InvalidConfiguration;
          }
        target = std::chrono::seconds(it->value().as_int64());
      }
    return outcome::success();
  }

} // namespace relpack
