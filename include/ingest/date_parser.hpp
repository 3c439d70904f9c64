#ifndef SENTINEL_DATE_PARSER_HPP_
#define SENTINEL_DATE_PARSER_HPP_

#include "../core/transaction.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace sentinel {
namespace ingest {

/**
 * Days since 1970-01-01 for a proleptic Gregorian date.
 * No validation; callers check ranges first.
 */
std::int64_t daysFromCivil(int year, unsigned month, unsigned day);

bool isValidDate(int year, int month, int day);

/**
 * Parse a date or date-time into epoch seconds.
 *
 * Accepts D/M/Y, D-M-Y and D.M.Y (or M/D/Y when day_first is false) with a
 * fallback to the swapped order when the preferred one is not a valid date,
 * and year-first Y-M-D / Y/M/D. An optional time part HH:MM[:SS[.fff]]
 * follows after a space or 'T'.
 *
 * Returns std::nullopt for anything unparsable; never throws.
 */
std::optional<EpochSeconds> parseDateTime(const std::string& text, bool day_first = true);

}  // namespace ingest
}  // namespace sentinel

#endif  // SENTINEL_DATE_PARSER_HPP_
