/**
 * @file template_registry.hpp
 * @brief Precompiled page templates served by the HTTP layer
 *
 * Templates are mustache files compiled once at startup. They are keyed
 * by file name without the ".mustache" suffix, e.g. "index.html".
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "bitcrush/core/result.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace bitcrush::web {

/**
 * @class template_registry
 * @brief Name to compiled template map
 *
 * Thread Safety: render() may be called concurrently with itself and
 * with add_template().
 */
class template_registry {
public:
  /// Templates the page endpoints require
  static const std::vector<std::string> &required_templates();

  /// File suffix stripped from template names
  static constexpr std::string_view kSuffix = ".mustache";

  template_registry();
  ~template_registry();

  template_registry(const template_registry &) = delete;
  template_registry &operator=(const template_registry &) = delete;

  /**
   * @brief Compile the required templates from a directory
   *
   * @param directory Directory holding index.html.mustache,
   *        style.css.mustache and main.js.mustache
   * @return error_codes::invalid_template_path when the directory does not
   *         exist, template_not_found for a missing file, or
   *         template_render_error when a file fails to compile
   */
  [[nodiscard]] VoidResult load_directory(const std::filesystem::path &directory);

  /**
   * @brief Compile a template from source text
   *
   * Replaces a template of the same name.
   */
  [[nodiscard]] VoidResult add_template(const std::string &name,
                                        const std::string &source);

  /**
   * @brief Render a template with an empty context
   * @return Rendered text, error_codes::template_not_found for an unknown
   *         name or template_render_error when rendering throws
   */
  [[nodiscard]] Result<std::string> render(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const;

  [[nodiscard]] std::size_t size() const;

  /// Sorted template names
  [[nodiscard]] std::vector<std::string> names() const;

private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

} // namespace bitcrush::web
