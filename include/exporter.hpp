/**
 * @file exporter.hpp
 * @brief Write inventory rows to CSV, JSON or XML, chosen by file extension.
 */
#ifndef ADOINVENTORY_EXPORTER_HPP
#define ADOINVENTORY_EXPORTER_HPP

#include "models.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace adoi {

/// Raised when rows cannot be written to the requested destination.
class ExportError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Output formats supported by export_rows().
enum class ExportFormat { Csv, Json, Xml };

/// Formatting switches for export_rows().
struct ExportOptions {
  bool pretty_json{true}; ///< Two-space indentation instead of compact JSON
};

/**
 * Resolve the export format from a path's extension, ignoring case.
 *
 * @throws ExportError For anything other than `.csv`, `.json` or `.xml`.
 */
ExportFormat export_format_for(const std::string &path);

/**
 * Write rows to `path`, overwriting any existing file.
 *
 * The same rows always produce byte-identical output.
 *
 * @throws ExportError On unsupported extensions or I/O failure.
 */
void export_rows(const std::vector<Row> &rows, const std::string &path,
                 const ExportOptions &options = {});

/// Render rows as CSV with a header built from first-appearance key order.
std::string render_csv(const std::vector<Row> &rows);

/// Render rows as a JSON array.
std::string render_json(const std::vector<Row> &rows, bool pretty);

/// Render rows as `<Records><Record>...</Record></Records>`.
std::string render_xml(const std::vector<Row> &rows);

/// Quote a CSV field when it contains a comma, quote or line break.
std::string escape_csv_field(const std::string &field);

} // namespace adoi

#endif // ADOINVENTORY_EXPORTER_HPP
