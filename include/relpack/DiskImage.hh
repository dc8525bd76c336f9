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

#ifndef RELPACK_DISK_IMAGE_HH
#define RELPACK_DISK_IMAGE_HH

#include <filesystem>
#include <memory>
#include <string>
#include <boost/outcome/std_result.hpp>

namespace outcome = boost::outcome_v2;

namespace relpack
{
  class ToolRunner;

  /**
   * @brief Creates and signs a disk image from an application bundle
   *
   * Used when the builder only produces the bundle.
   */
  class DiskImageCreator
  {
  public:
    virtual ~DiskImageCreator() = default;

    /**
     * @return outcome::std_result<void> PipelineError::DiskImageFailed if
     *         the image could not be created or signed
     */
    virtual outcome::std_result<void> create(const std::filesystem::path &bundle,
                                             const std::filesystem::path &disk_image,
                                             const std::string &volume_name,
                                             const std::string &signing_identity) = 0;

    // hdiutil create ... followed by codesign --force --timestamp --sign
    static std::shared_ptr<DiskImageCreator> hdiutil(std::shared_ptr<ToolRunner> runner, std::string hdiutil_tool, std::string codesign_tool);
  };

} // namespace relpack

#endif // RELPACK_DISK_IMAGE_HH
