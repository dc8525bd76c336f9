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

#include <cstdlib>
#include <iostream>
#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include "ConfigLoader.hh"
#include "Logging.hh"
#include "relpack/Credentials.hh"
#include "relpack/ReleasePipeline.hh"

namespace po = boost::program_options;

namespace
{
  void print_summary(const relpack::PublishResult &result, const relpack::RunReport &report)
  {
    std::cout << "\n======================================\n"
              << "Build complete!\n"
              << "======================================\n\n"
              << "Artifact: " << result.destination_path.string() << "\n"
              << "Size:     " << relpack::human_readable_size(result.size_bytes) << "\n"
              << "SHA-256:  " << result.sha256 << "\n";

    if (!report.warnings.empty())
      {
        std::cout << "\nWarnings:\n";
        for (const auto &warning: report.warnings)
          {
            std::cout << "  - " << warning.message() << "\n";
          }
      }

    std::cout << "\nVerification commands:\n"
              << "  codesign -dv --verbose=4 \"" << result.source_path.string() << "\"\n"
              << "  spctl -a -t open --context context:primary-signature \"" << result.source_path.string() << "\"\n";
  }

  void print_failure(const std::error_code &error, const relpack::PipelineConfig &config, const relpack::RunReport &report)
  {
    std::cerr << "\nRelease failed: " << error.message() << "\n";

    if (!report.missing_credentials.empty())
      {
        std::cerr << "Missing required environment variables:\n";
        for (auto field: report.missing_credentials)
          {
            std::cerr << "  - " << relpack::variable_name(field) << "\n";
          }
      }

    auto remediation = relpack::remediation_for(error, config);
    if (!remediation.empty())
      {
        std::cerr << "\n" << remediation << "\n";
      }
  }
} // namespace

int main(int argc, char *argv[])
{
  po::options_description options("Usage: relpack [options]");
  options.add_options()
    ("help,h", "show this help message")
    ("config,c", po::value<std::string>(), "JSON configuration file")
    ("env-file", po::value<std::string>(), "file with KEY=VALUE credential entries")
    ("publish-dir", po::value<std::string>(), "directory receiving the published artifact")
    ("poll-interval", po::value<int>(), "seconds between two polls of the build")
    ("deadline", po::value<int>(), "seconds after which polling gives up")
    ("skip-notarization", po::bool_switch(), "do not submit the artifact for notarization")
    ("log-file", po::value<std::string>(), "also write the log to this file")
    ("verbose,v", po::bool_switch(), "enable debug logging");

  po::variables_map vm;
  try
    {
      po::store(po::parse_command_line(argc, argv, options), vm);
      po::notify(vm);
    }
  catch (const po::error &e)
    {
      std::cerr << "relpack: " << e.what() << "\n\n" << options << "\n";
      return EXIT_FAILURE;
    }

  if (vm.count("help") != 0U)
    {
      std::cout << options << "\n";
      return EXIT_SUCCESS;
    }

  std::optional<std::filesystem::path> log_file;
  if (vm.count("log-file") != 0U)
    {
      log_file = vm["log-file"].as<std::string>();
    }
  auto logging = relpack::Logging::setup(vm["verbose"].as<bool>() ? spdlog::level::debug : spdlog::level::info, log_file);
  if (!logging)
    {
      return EXIT_FAILURE;
    }
  auto logger = relpack::Logging::create("relpack:cli");

  relpack::PipelineConfig config;
  if (vm.count("config") != 0U)
    {
      relpack::ConfigLoader loader;
      auto loaded = loader.load_from_file(vm["config"].as<std::string>());
      if (!loaded)
        {
          print_failure(loaded.error(), config, {});
          return EXIT_FAILURE;
        }
      config = loaded.value();
    }

  if (vm.count("env-file") != 0U)
    {
      config.credentials.env_file = vm["env-file"].as<std::string>();
    }
  if (vm.count("publish-dir") != 0U)
    {
      config.publish_directory = vm["publish-dir"].as<std::string>();
    }
  if (vm.count("poll-interval") != 0U)
    {
      auto interval = vm["poll-interval"].as<int>();
      if (interval <= 0)
        {
          logger->error("--poll-interval must be positive, got: {}", interval);
          return EXIT_FAILURE;
        }
      config.poll.interval = std::chrono::seconds(interval);
    }
  if (vm.count("deadline") != 0U)
    {
      auto deadline = vm["deadline"].as<int>();
      if (deadline <= 0)
        {
          logger->error("--deadline must be positive, got: {}", deadline);
          return EXIT_FAILURE;
        }
      config.poll.deadline = std::chrono::seconds(deadline);
    }
  if (vm["skip-notarization"].as<bool>())
    {
      config.notarization.enabled = false;
    }

  relpack::ReleasePipeline pipeline(config, relpack::Collaborators::system(config));
  auto result = pipeline.run();
  if (!result)
    {
      print_failure(result.error(), config, pipeline.report());
      return EXIT_FAILURE;
    }

  print_summary(result.value(), pipeline.report());
  return EXIT_SUCCESS;
}
