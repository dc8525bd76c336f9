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

#ifndef RELPACK_ENV_FILE_LOADER_HH
#define RELPACK_ENV_FILE_LOADER_HH

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>
#include <spdlog/spdlog.h>

#include "Logging.hh"

namespace outcome = boost::outcome_v2;

namespace relpack
{
  /**
   * @brief Reads KEY=VALUE files such as .env.local
   *
   * Lines without a separator and lines whose key starts with '#' are skipped. Keys are
   * trimmed and lose an optional "export " prefix; values keep everything after the first '=' except a trailing
   * carriage return and one pair of matching surrounding quotes.
   */
  class EnvFileLoader
  {
  public:
    using Entries = std::map<std::string, std::string>;

    EnvFileLoader() = default;
    ~EnvFileLoader() = default;

    EnvFileLoader(const EnvFileLoader &) = delete;
    EnvFileLoader &operator=(const EnvFileLoader &) = delete;
    EnvFileLoader(EnvFileLoader &&) noexcept = default;
    EnvFileLoader &operator=(EnvFileLoader &&) noexcept = default;

    outcome::std_result<Entries> load_from_file(const std::filesystem::path &file_path);
    Entries load_from_string(const std::string &content);

  private:
    std::shared_ptr<spdlog::logger> logger_{Logging::create("relpack:env_file_loader")};
  };

} // namespace relpack

#endif // RELPACK_ENV_FILE_LOADER_HH
