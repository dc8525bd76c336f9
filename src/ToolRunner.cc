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

#include "relpack/ToolRunner.hh"

#include <algorithm>

#include "ProcessToolRunner.hh"

namespace relpack
{
  namespace
  {
    std::string quote(const std::string &argument)
    {
      if (!argument.empty() && argument.find_first_of(" \t\"'") == std::string::npos)
        {
          return argument;
        }

      std::string quoted{"\""};
      for (char c: argument)
        {
          if (c == '"' || c == '\\')
            {
              quoted += '\\';
            }
          quoted += c;
        }
      quoted += '"';
      return quoted;
    }
  } // namespace

  std::string Command::describe() const
  {
    auto redact = [this](const std::string &value) -> std::string {
      bool sensitive = std::any_of(sensitive_values.begin(), sensitive_values.end(), [&value](const std::string &secret) {
        return !secret.empty() && value == secret;
      });
      return sensitive ? "****" : quote(value);
    };

    std::string description = quote(program);
    for (const auto &argument: arguments)
      {
        description += ' ';
        description += redact(argument);
      }
    return description;
  }

  std::shared_ptr<ToolRunner> ToolRunner::instance()
  {
    return std::make_shared<ProcessToolRunner>();
  }

} // namespace relpack
