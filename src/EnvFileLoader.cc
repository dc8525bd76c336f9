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

#include "EnvFileLoader.hh"

#include <fstream>
#include <iterator>
#include <sstream>

#include "relpack/Errors.hh"

namespace relpack
{
  namespace
  {
    std::string trim(const std::string &text)
    {
      const auto *whitespace = " \t\r\n";
      auto begin = text.find_first_not_of(whitespace);
      if (begin == std::string::npos)
        {
          return {};
        }
      auto end = text.find_last_not_of(whitespace);
      return text.substr(begin, end - begin + 1);
    }

    std::string unquote(std::string value)
    {
      if (!value.empty() && value.back() == '\r')
        {
          value.pop_back();
        }

      if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
        {
          return value.substr(1, value.size() - 2);
        }
      return value;
    }
  } // namespace

  outcome::std_result<EnvFileLoader::Entries> EnvFileLoader::load_from_file(const std::filesystem::path &file_path)
  {
    std::ifstream file(file_path, std::ios::in | std::ios::binary);
    if (!file.is_open())
      {
        logger_->error("Failed to open file: {}", file_path.string());
        return PipelineError::SystemError;
      }

    std::string content;
    try
      {
        content.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
      }
    catch (const std::exception &e)
      {
        logger_->error("Error while reading file: {}: {}", file_path.string(), e.what());
        return PipelineError::SystemError;
      }

    if (file.bad())
      {
        logger_->error("Error while reading file: {}", file_path.string());
        return PipelineError::SystemError;
      }

    return load_from_string(content);
  }

  EnvFileLoader::Entries EnvFileLoader::load_from_string(const std::string &content)
  {
    Entries entries;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line))
      {
        auto separator = line.find('=');
        if (separator == std::string::npos)
          {
            continue;
          }

        auto key = trim(line.substr(0, separator));
        if (key.empty() || key.front() == '#')
          {
            continue;
          }
        if (key.rfind("export ", 0) == 0)
          {
            key = trim(key.substr(7));
          }
        entries[key] = unquote(line.substr(separator + 1));
      }

    logger_->debug("Read {} entries", entries.size());
    return entries;
  }

} // namespace relpack
