/**
 * @file exporter.cpp
 * @brief CSV, JSON and XML rendering of inventory rows.
 */

#include "exporter.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <tinyxml2.h>

namespace adoi {

namespace {

std::shared_ptr<spdlog::logger> export_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("export");
  }();
  return logger;
}

/// Render a scalar cell. Arrays are joined with "; ", objects become JSON.
std::string cell_text(const Row &value) {
  if (value.is_null()) {
    return {};
  }
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_boolean()) {
    return value.get<bool>() ? "true" : "false";
  }
  if (value.is_array()) {
    std::string joined;
    for (const auto &item : value) {
      if (!joined.empty()) {
        joined += "; ";
      }
      joined += cell_text(item);
    }
    return joined;
  }
  return value.dump();
}

std::vector<std::string> collect_columns(const std::vector<Row> &rows) {
  std::vector<std::string> columns;
  for (const auto &row : rows) {
    if (!row.is_object()) {
      continue;
    }
    for (auto it = row.begin(); it != row.end(); ++it) {
      if (std::find(columns.begin(), columns.end(), it.key()) ==
          columns.end()) {
        columns.push_back(it.key());
      }
    }
  }
  return columns;
}

/// Coerce a field name into a valid XML element name.
std::string xml_name(const std::string &key) {
  std::string name;
  name.reserve(key.size());
  for (char c : key) {
    unsigned char uc = static_cast<unsigned char>(c);
    name += (std::isalnum(uc) || c == '_' || c == '-' || c == '.') ? c : '_';
  }
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0])) ||
      name[0] == '-' || name[0] == '.') {
    name.insert(name.begin(), '_');
  }
  return name;
}

void append_xml_value(tinyxml2::XMLDocument &doc, tinyxml2::XMLElement *parent,
                      const Row &value) {
  if (value.is_array()) {
    for (const auto &item : value) {
      tinyxml2::XMLElement *child = doc.NewElement("Item");
      append_xml_value(doc, child, item);
      parent->InsertEndChild(child);
    }
  } else if (value.is_object()) {
    for (auto it = value.begin(); it != value.end(); ++it) {
      tinyxml2::XMLElement *child = doc.NewElement(xml_name(it.key()).c_str());
      append_xml_value(doc, child, it.value());
      parent->InsertEndChild(child);
    }
  } else {
    std::string text = cell_text(value);
    if (!text.empty()) {
      parent->SetText(text.c_str());
    }
  }
}

void write_file(const std::string &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw ExportError("Failed to open " + path + " for writing");
  }
  out << content;
  out.flush();
  if (!out) {
    throw ExportError("Failed to write " + path);
  }
}

} // namespace

std::string escape_csv_field(const std::string &field) {
  std::string_view view(field);
  bool needs_wrap = view.find(',') != std::string_view::npos ||
                    view.find('"') != std::string_view::npos ||
                    view.find('\n') != std::string_view::npos ||
                    view.find('\r') != std::string_view::npos;
  std::string escaped;
  escaped.reserve(field.size());
  for (char c : view) {
    if (c == '"') {
      escaped += "\"\"";
    } else {
      escaped += c;
    }
  }
  if (needs_wrap) {
    return std::string("\"") + escaped + "\"";
  }
  return escaped;
}

ExportFormat export_format_for(const std::string &path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (ext == ".csv") {
    return ExportFormat::Csv;
  }
  if (ext == ".json") {
    return ExportFormat::Json;
  }
  if (ext == ".xml") {
    return ExportFormat::Xml;
  }
  throw ExportError("Unsupported export format '" + ext + "' for " + path +
                    " (use .csv, .json or .xml)");
}

std::string render_csv(const std::vector<Row> &rows) {
  std::vector<std::string> columns = collect_columns(rows);
  if (columns.empty()) {
    return {};
  }
  std::string out;
  for (std::size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) {
      out += ',';
    }
    out += escape_csv_field(columns[i]);
  }
  out += '\n';
  for (const auto &row : rows) {
    for (std::size_t i = 0; i < columns.size(); ++i) {
      if (i > 0) {
        out += ',';
      }
      auto it = row.find(columns[i]);
      if (it != row.end()) {
        out += escape_csv_field(cell_text(*it));
      }
    }
    out += '\n';
  }
  return out;
}

std::string render_json(const std::vector<Row> &rows, bool pretty) {
  Row array = Row::array();
  for (const auto &row : rows) {
    array.push_back(row);
  }
  return pretty ? array.dump(2) + "\n" : array.dump() + "\n";
}

std::string render_xml(const std::vector<Row> &rows) {
  tinyxml2::XMLDocument doc;
  doc.InsertEndChild(doc.NewDeclaration());
  tinyxml2::XMLElement *root = doc.NewElement("Records");
  doc.InsertEndChild(root);
  for (const auto &row : rows) {
    tinyxml2::XMLElement *record = doc.NewElement("Record");
    append_xml_value(doc, record, row);
    root->InsertEndChild(record);
  }
  tinyxml2::XMLPrinter printer;
  doc.Print(&printer);
  return std::string(printer.CStr());
}

void export_rows(const std::vector<Row> &rows, const std::string &path,
                 const ExportOptions &options) {
  ExportFormat format = export_format_for(path);
  export_log()->debug("Exporting {} row(s) to {}", rows.size(), path);
  std::string content;
  switch (format) {
  case ExportFormat::Csv:
    content = render_csv(rows);
    break;
  case ExportFormat::Json:
    content = render_json(rows, options.pretty_json);
    break;
  case ExportFormat::Xml:
    content = render_xml(rows);
    break;
  }
  write_file(path, content);
  export_log()->info("Wrote {} record(s) to {}", rows.size(), path);
}

} // namespace adoi
