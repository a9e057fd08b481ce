/**
 * @file template_registry.cpp
 * @brief Page template compilation and rendering
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any bitcrush headers
#include "crow.h"

#include "bitcrush/web/template_registry.hpp"

#include <algorithm>
#include <fstream>
#include <map>
#include <shared_mutex>
#include <sstream>

namespace bitcrush::web {

namespace {

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return bitcrush_error<std::string>(error_codes::template_not_found,
                                       "Template file missing", path.string());
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return ok<std::string>(buffer.str());
}

} // namespace

struct template_registry::impl {
  mutable std::shared_mutex mutex;
  std::map<std::string, crow::mustache::template_t, std::less<>> templates;
};

const std::vector<std::string> &template_registry::required_templates() {
  static const std::vector<std::string> names = {"index.html", "style.css",
                                                 "main.js"};
  return names;
}

template_registry::template_registry() : impl_(std::make_unique<impl>()) {}

template_registry::~template_registry() = default;

VoidResult
template_registry::load_directory(const std::filesystem::path &directory) {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    return bitcrush_void_error(error_codes::invalid_template_path,
                               "Template directory not found",
                               directory.string());
  }

  for (const auto &name : required_templates()) {
    auto path = directory / (name + std::string(kSuffix));
    auto source = read_file(path);
    if (source.is_err()) {
      return source.error();
    }
    auto added = add_template(name, source.value());
    if (added.is_err()) {
      return added;
    }
  }
  return ok();
}

VoidResult template_registry::add_template(const std::string &name,
                                           const std::string &source) {
  try {
    auto compiled = crow::mustache::compile(source);
    std::unique_lock lock(impl_->mutex);
    impl_->templates.insert_or_assign(name, std::move(compiled));
  } catch (const crow::mustache::invalid_template_exception &e) {
    return bitcrush_void_error(error_codes::template_render_error,
                               "Template failed to compile",
                               name + ": " + e.what());
  }
  return ok();
}

Result<std::string> template_registry::render(std::string_view name) const {
  std::shared_lock lock(impl_->mutex);

  auto it = impl_->templates.find(name);
  if (it == impl_->templates.end()) {
    return bitcrush_error<std::string>(error_codes::template_not_found,
                                       "Unknown template", std::string(name));
  }

  try {
    crow::mustache::context ctx;
    return ok<std::string>(it->second.render_string(ctx));
  } catch (const std::exception &e) {
    return bitcrush_error<std::string>(error_codes::template_render_error,
                                       "Template failed to render",
                                       std::string(name) + ": " + e.what());
  }
}

bool template_registry::contains(std::string_view name) const {
  std::shared_lock lock(impl_->mutex);
  return impl_->templates.find(name) != impl_->templates.end();
}

std::size_t template_registry::size() const {
  std::shared_lock lock(impl_->mutex);
  return impl_->templates.size();
}

std::vector<std::string> template_registry::names() const {
  std::shared_lock lock(impl_->mutex);
  std::vector<std::string> result;
  result.reserve(impl_->templates.size());
  for (const auto &[name, tmpl] : impl_->templates) {
    result.push_back(name);
  }
  return result;
}

} // namespace bitcrush::web
