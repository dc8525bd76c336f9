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

#ifndef RELPACK_CONFIG_LOADER_HH
#define RELPACK_CONFIG_LOADER_HH

#include <filesystem>
#include <memory>
#include <string>
#include <boost/json.hpp>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"
#include "relpack/Config.hh"

namespace outcome = boost::outcome_v2;

namespace relpack
{
  /**
   * @brief Reads a PipelineConfig from JSON
   *
   * Every member is optional; absent members keep their default value.
   *
   * @code
   * {
   *   "product": { "name": "KeliCAD Agent", "version": "1.0.0", "arch": "aarch64" },
   *   "builder": { "command": ["npx", "@tauri-apps/cli", "build"], "produces_disk_image": true },
   *   "poll": { "interval_seconds": 5, "deadline_seconds": 600 },
   *   "publish": { "directory": "../public/downloads" }
   * }
   * @endcode
   */
  class ConfigLoader
  {
  public:
    ConfigLoader() = default;
    ~ConfigLoader() = default;

    ConfigLoader(const ConfigLoader &) = delete;
    ConfigLoader &operator=(const ConfigLoader &) = delete;
    ConfigLoader(ConfigLoader &&) noexcept = default;
    ConfigLoader &operator=(ConfigLoader &&) noexcept = default;

    outcome::std_result<PipelineConfig> load_from_file(const std::filesystem::path &file_path);
    outcome::std_result<PipelineConfig> load_from_json(const std::string &json_content);

  private:
    outcome::std_result<void> parse_product(const boost::json::object &root, PipelineConfig &config);
    outcome::std_result<void> parse_builder(const boost::json::object &root, PipelineConfig &config);
    outcome::std_result<void> parse_credentials(const boost::json::object &root, PipelineConfig &config);
    outcome::std_result<void> parse_poll(const boost::json::object &root, PipelineConfig &config);
    outcome::std_result<void> parse_notarization(const boost::json::object &root, PipelineConfig &config);
    outcome::std_result<void> parse_publish(const boost::json::object &root, PipelineConfig &config);
    outcome::std_result<void> parse_validation(const boost::json::object &root, PipelineConfig &config);
    outcome::std_result<void> parse_tools(const boost::json::object &root, PipelineConfig &config);

    outcome::std_result<const boost::json::object *> section(const boost::json::object &root, const char *name);
    outcome::std_result<void> read_string(const boost::json::object &obj, const std::string &prefix, const char *key, std::string &target);
    outcome::std_result<void> read_path(const boost::json::object &obj, const std::string &prefix, const char *key, std::filesystem::path &target);
    outcome::std_result<void> read_bool(const boost::json::object &obj, const std::string &prefix, const char *key, bool &target);
    outcome::std_result<void> read_seconds(const boost::json::object &obj, const std::string &prefix, const char *key, std::chrono::seconds &target);

    std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:config_loader")};
  };

} // namespace relpack

#endif // RELPACK_CONFIG_LOADER_HH
