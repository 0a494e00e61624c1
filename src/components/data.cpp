#include "pml/components/data.hpp"

#include "pml/component/schema.hpp"
#include "pml/render/context.hpp"

#include "core/log_internal.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>

namespace pml::components {

namespace {

constexpr std::pair<std::string_view, std::string_view> kExtensionLanguages[] = {
  {".ts", "typescript"}, {".tsx", "typescript"}, {".js", "javascript"}, {".jsx", "javascript"},
  {".json", "json"},     {".md", "markdown"},    {".py", "python"},     {".rb", "ruby"},
  {".go", "go"},         {".rs", "rust"},        {".java", "java"},     {".c", "c"},
  {".cpp", "cpp"},       {".h", "c"},            {".hpp", "cpp"},       {".css", "css"},
  {".scss", "scss"},     {".html", "html"},      {".xml", "xml"},       {".yaml", "yaml"},
  {".yml", "yaml"},      {".sh", "bash"},        {".sql", "sql"},
};

Node fenced(std::string_view language, Node body) {
  return Array{"```" + std::string(language) + "\n", std::move(body), "\n```"};
}

}  // namespace

std::string_view language_for_extension(std::string_view extension) noexcept {
  for (const auto& [ext, lang] : kExtensionLanguages) {
    if (ext == extension) {
      return lang;
    }
  }
  return {};
}

const Schema* File::schema() const noexcept {
  static const Schema kSchema = Schema{}.required("path", kind::string).optional("language", kind::string);
  return &kSchema;
}

Node File::render(const Props& props, const Value&, RenderContext&) const {
  const std::filesystem::path path(props.string_or("path", ""));

  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    const std::string reason = std::strerror(errno);
    core::detail::logger().debug("File: cannot open {}: {}", path.string(), reason);
    return "[Error reading file: " + path.string() + ": " + reason + "]";
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return "[Error reading file: " + path.string() + ": read failed]";
  }

  std::string language = props.string_or("language", "");
  if (language.empty()) {
    language = std::string(language_for_extension(path.extension().string()));
  }
  return Array{"<!-- " + path.filename().string() + " -->\n", fenced(language, std::move(content))};
}

const Schema* Code::schema() const noexcept {
  static const Schema kSchema = Schema{}.optional("language", kind::string).optional("filename", kind::string);
  return &kSchema;
}

Node Code::render(const Props& props, const Value&, RenderContext& ctx) const {
  const auto language = props.string_or("language", ctx.env().code.language);
  const auto filename = props.string_or("filename", "");
  if (filename.empty()) {
    return fenced(language, props.children());
  }
  return Array{"<!-- " + filename + " -->\n", fenced(language, props.children())};
}

const Schema* Json::schema() const noexcept {
  static const Schema kSchema = Schema{}.required("value", kind::any);
  return &kSchema;
}

Node Json::render(const Props& props, const Value&, RenderContext& ctx) const {
  const int width = static_cast<int>(ctx.env().output.indent.size());
  return to_json(props["value"], width);
}

}  // namespace pml::components
