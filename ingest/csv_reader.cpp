#include "ingest/csv_reader.hpp"

#include "core/errors.hpp"
#include "ingest/date_parser.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <unordered_map>

namespace sentinel {
namespace ingest {

namespace {

using observability::LogLevel;

const char kTimestampColumn[] = "trans_date_trans_time";
const char kCategoryColumn[] = "category";
const char kAmountColumn[] = "amt";
const char kLatitudeColumn[] = "lat";
const char kLongitudeColumn[] = "long";
const char kMerchantLatitudeColumn[] = "merch_lat";
const char kMerchantLongitudeColumn[] = "merch_long";
const char kBirthDateColumn[] = "dob";
const char kFraudColumn[] = "is_fraud";
const char kMerchantColumn[] = "merchant";

std::string trim(const std::string& value) {
  auto begin = std::find_if_not(value.begin(), value.end(),
                                [](unsigned char c) { return std::isspace(c) != 0; });
  auto end = std::find_if_not(value.rbegin(), value.rend(),
                              [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) return "";
  return std::string(begin, end);
}

// Splits one record into fields. A double quote opens a quoted field only
// at the start of a field and is literal anywhere else; inside a quoted
// field "" is an escaped quote. Returns true when the record ends inside
// an open quoted field.
bool scanRecord(const std::string& record, std::vector<std::string>* fields) {
  std::string current;
  bool in_quotes = false;
  bool field_start = true;

  for (size_t i = 0; i < record.size(); ++i) {
    char c = record[i];
    if (in_quotes) {
      if (c != '"') {
        current.push_back(c);
      } else if (i + 1 < record.size() && record[i + 1] == '"') {
        current.push_back('"');
        ++i;
      } else {
        in_quotes = false;
      }
    } else if (c == ',') {
      if (fields) fields->push_back(current);
      current.clear();
      field_start = true;
      continue;
    } else if (c == '"' && field_start) {
      in_quotes = true;
    } else {
      current.push_back(c);
    }
    field_start = false;
  }

  if (fields) fields->push_back(current);
  return in_quotes;
}

// Reads one logical record, joining physical lines inside quoted fields.
bool readRecord(std::istream& input, std::string& record) {
  record.clear();
  std::string line;
  bool any = false;
  while (std::getline(input, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (any) {
      record += '\n';
    }
    record += line;
    any = true;
    if (!scanRecord(record, nullptr)) {
      return true;
    }
  }
  return any;
}

bool isBlank(const std::string& record) {
  return std::all_of(record.begin(), record.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

// Tracks per-field recoveries and rate-limits the warnings about them.
class FieldRecovery {
 public:
  FieldRecovery(const std::string& source, size_t max_logged, IngestReport& report)
      : source_(source), max_logged_(max_logged), report_(report) {}

  void record(size_t row, const std::string& column, const std::string& value) {
    report_.malformed_fields += 1;
    if (logged_ < max_logged_) {
      SENTINEL_LOG_BUILDER(LogLevel::WARN, "Unparsable field, value left undefined")
          .field("source", source_)
          .field("row", row)
          .field("column", column)
          .field("value", value);
      logged_ += 1;
    }
  }

 private:
  const std::string& source_;
  size_t max_logged_;
  size_t logged_ = 0;
  IngestReport& report_;
};

}  // namespace

double parseNumberOrNaN(const std::string& text) {
  std::string value = trim(text);
  if (value.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }

  errno = 0;
  char* end = nullptr;
  double parsed = std::strtod(value.c_str(), &end);
  if (end != value.c_str() + value.size() || errno == ERANGE) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  // strtod also takes "inf", "nan" and hex floats; only finite decimals count
  if (!std::isfinite(parsed) || value.find_first_of("xX") != std::string::npos) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return parsed;
}

std::optional<bool> parseFraudLabel(const std::string& text) {
  std::string value = trim(text);
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (value == "1" || value == "true") return true;
  if (value == "0" || value == "false") return false;

  // Labels exported as floats ("1.0")
  double numeric = parseNumberOrNaN(value);
  if (numeric == 1.0) return true;
  if (numeric == 0.0) return false;
  return std::nullopt;
}

CsvReader::CsvReader(IngestOptions options) : options_(options) {}

const std::vector<std::string>& CsvReader::requiredColumns() {
  static const std::vector<std::string> columns = {
      kTimestampColumn, kCategoryColumn, kAmountColumn, kLatitudeColumn,
      kLongitudeColumn, kMerchantLatitudeColumn, kMerchantLongitudeColumn,
      kBirthDateColumn, kFraudColumn, kMerchantColumn};
  return columns;
}

std::vector<std::string> CsvReader::splitRecord(const std::string& record) {
  std::vector<std::string> fields;
  scanRecord(record, &fields);
  return fields;
}

IngestResult CsvReader::readFile(const std::string& path) const {
  std::ifstream file(path);
  if (!file) {
    throw IngestError("unable to open " + path);
  }
  return read(file, path);
}

IngestResult CsvReader::read(std::istream& input, const std::string& source_name) const {
  IngestResult result;
  result.report.source = source_name;

  std::string record;
  bool have_header = false;
  while (readRecord(input, record)) {
    if (!isBlank(record)) {
      have_header = true;
      break;
    }
  }
  if (!have_header) {
    throw IngestError(source_name + " has no header row");
  }

  // Strip a UTF-8 byte order mark
  if (record.size() >= 3 && record.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    record.erase(0, 3);
  }

  std::unordered_map<std::string, size_t> column_index;
  auto header = splitRecord(record);
  for (size_t i = 0; i < header.size(); ++i) {
    column_index.emplace(trim(header[i]), i);
  }

  std::vector<std::string> missing;
  for (const auto& column : requiredColumns()) {
    if (column_index.find(column) == column_index.end()) {
      missing.push_back(column);
    }
  }
  if (!missing.empty()) {
    std::string names;
    for (const auto& column : missing) {
      if (!names.empty()) names += ", ";
      names += column;
    }
    throw IngestError(source_name + " is missing required column(s): " + names);
  }

  const size_t ts_idx = column_index.at(kTimestampColumn);
  const size_t category_idx = column_index.at(kCategoryColumn);
  const size_t amount_idx = column_index.at(kAmountColumn);
  const size_t lat_idx = column_index.at(kLatitudeColumn);
  const size_t long_idx = column_index.at(kLongitudeColumn);
  const size_t merch_lat_idx = column_index.at(kMerchantLatitudeColumn);
  const size_t merch_long_idx = column_index.at(kMerchantLongitudeColumn);
  const size_t dob_idx = column_index.at(kBirthDateColumn);
  const size_t fraud_idx = column_index.at(kFraudColumn);
  const size_t merchant_idx = column_index.at(kMerchantColumn);

  FieldRecovery recovery(source_name, options_.max_logged_warnings, result.report);

  size_t row_number = 0;
  while (readRecord(input, record)) {
    if (isBlank(record)) continue;
    row_number += 1;

    auto fields = splitRecord(record);
    if (fields.size() < header.size()) {
      result.report.short_rows += 1;
      fields.resize(header.size());
    }

    auto number = [&](size_t idx, const char* column) {
      double value = parseNumberOrNaN(fields[idx]);
      if (std::isnan(value)) {
        recovery.record(row_number, column, fields[idx]);
      }
      return value;
    };

    auto date = [&](size_t idx, const char* column) {
      auto value = parseDateTime(fields[idx], options_.day_first);
      if (!value) {
        recovery.record(row_number, column, fields[idx]);
      }
      return value;
    };

    RawTransaction tx;
    tx.transaction_time = date(ts_idx, kTimestampColumn);
    tx.category = trim(fields[category_idx]);
    tx.amount = number(amount_idx, kAmountColumn);
    tx.cardholder_latitude = number(lat_idx, kLatitudeColumn);
    tx.cardholder_longitude = number(long_idx, kLongitudeColumn);
    tx.merchant_latitude = number(merch_lat_idx, kMerchantLatitudeColumn);
    tx.merchant_longitude = number(merch_long_idx, kMerchantLongitudeColumn);
    tx.date_of_birth = date(dob_idx, kBirthDateColumn);
    tx.fraud_label = parseFraudLabel(fields[fraud_idx]);
    if (!tx.fraud_label) {
      recovery.record(row_number, kFraudColumn, fields[fraud_idx]);
    }
    tx.merchant_name = fields[merchant_idx];

    result.transactions.push_back(std::move(tx));
  }

  result.report.rows_read = result.transactions.size();

  auto& metrics = observability::getGlobalMetrics();
  metrics.incrementCounter("sentinel_rows_ingested_total",
                           static_cast<double>(result.report.rows_read));
  metrics.incrementCounter("sentinel_malformed_fields_total",
                           static_cast<double>(result.report.malformed_fields));

  SENTINEL_LOG_BUILDER(LogLevel::INFO, "Ingested transaction batch")
      .field("source", source_name)
      .field("rows", result.report.rows_read)
      .field("malformed_fields", result.report.malformed_fields)
      .field("short_rows", result.report.short_rows);

  return result;
}

}  // namespace ingest
}  // namespace sentinel
