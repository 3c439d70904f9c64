#ifndef SENTINEL_CSV_READER_HPP_
#define SENTINEL_CSV_READER_HPP_

#include "../core/transaction.hpp"

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace sentinel {
namespace ingest {

struct IngestOptions {
  bool day_first = true;
  // Per-field warnings logged before the reader goes quiet
  size_t max_logged_warnings = 10;
};

/**
 * Counts of what ingestion had to recover from.
 */
struct IngestReport {
  std::string source;
  size_t rows_read = 0;
  size_t malformed_fields = 0;
  size_t short_rows = 0;
};

struct IngestResult {
  std::vector<RawTransaction> transactions;
  IngestReport report;
};

/**
 * Reads the transaction table from CSV.
 *
 * Structural problems (unreadable source, no header, missing required
 * column) throw IngestError. Field-level problems never abort the batch:
 * dates become absent, numbers become NaN, labels become absent.
 */
class CsvReader {
 public:
  explicit CsvReader(IngestOptions options = IngestOptions{});

  IngestResult readFile(const std::string& path) const;
  IngestResult read(std::istream& input, const std::string& source_name = "<stream>") const;

  /**
   * Column names the reader requires in the header.
   */
  static const std::vector<std::string>& requiredColumns();

  /**
   * Split one CSV record into fields, honouring double quotes.
   */
  static std::vector<std::string> splitRecord(const std::string& record);

 private:
  IngestOptions options_;
};

/**
 * Strict decimal parse; NaN when the text is empty, not fully numeric,
 * hexadecimal, out of range or not finite.
 */
double parseNumberOrNaN(const std::string& text);

/**
 * Accepts 0/1 and true/false (case-insensitive).
 */
std::optional<bool> parseFraudLabel(const std::string& text);

}  // namespace ingest
}  // namespace sentinel

#endif  // SENTINEL_CSV_READER_HPP_
