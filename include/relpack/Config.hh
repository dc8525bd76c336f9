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

#ifndef RELPACK_CONFIG_HH
#define RELPACK_CONFIG_HH

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace relpack
{
  struct ProductSettings
  {
    std::string name{"KeliCAD Agent"};
    std::string version{"1.0.0"};
    std::string arch{"aarch64"};
  };

  struct BuilderSettings
  {
    std::vector<std::string> command{"npx", "@tauri-apps/cli", "build"};
    std::filesystem::path working_directory{"."};
    std::filesystem::path output_root{"src-tauri/target/release/bundle"};
    std::optional<std::filesystem::path> bundle_path;
    std::optional<std::filesystem::path> artifact_path;
    bool produces_disk_image{true};
    std::chrono::seconds terminate_grace{10};
  };

  struct CredentialSettings
  {
    std::optional<std::filesystem::path> env_file{"../.env.local"};
    std::string identity_class{"Developer ID Application"};
  };

  struct PollSettings
  {
    std::chrono::seconds interval{5};
    std::chrono::seconds deadline{600};
    std::chrono::seconds heartbeat{30};

    // Outputs older than the build start are not observed. Follows
    // PipelineConfig::reject_stale_artifacts.
    bool ignore_stale_outputs{true};
  };

  struct NotarizationSettings
  {
    bool enabled{true};
    std::string acceptance_marker{"Accepted"};
    std::chrono::seconds staple_grace{30};
    int staple_attempts{6};
    std::chrono::seconds staple_backoff{10};
  };

  struct ToolSettings
  {
    std::string xcrun{"xcrun"};
    std::string codesign{"codesign"};
    std::string spctl{"spctl"};
    std::string security{"security"};
    std::string hdiutil{"hdiutil"};
  };

  /**
   * @brief Complete configuration of a release run
   *
   * Default values reproduce the layout of a Tauri application build:
   * the bundle in <output_root>/macos and the disk image in
   * <output_root>/dmg.
   */
  struct PipelineConfig
  {
    ProductSettings product;
    BuilderSettings builder;
    CredentialSettings credentials;
    PollSettings poll;
    NotarizationSettings notarization;
    std::filesystem::path publish_directory{"../public/downloads"};
    bool reject_stale_artifacts{true};
    ToolSettings tools;

    /**
     * @brief Path of the application bundle produced by the builder
     */
    std::filesystem::path bundle_path() const;

    /**
     * @brief Path of the distributable disk image
     */
    std::filesystem::path artifact_path() const;
  };

} // namespace relpack

#endif // RELPACK_CONFIG_HH
