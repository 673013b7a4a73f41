#pragma once

#include "ledgerguard/validation_error.hpp"
#include <string>
#include <string_view>

namespace ledgerguard {

/**
 * @brief Generic string screening and neutralisation.
 *
 * sanitizeString() runs the full cascade: length cap, SQL and XSS detectors,
 * whitespace trim, HTML entity encoding and a final UTF-8 check. Encoding
 * leaves existing &amp; &lt; &gt; &#39; &#34; entities untouched, so
 * sanitizing an already sanitized string returns it unchanged.
 */
class Sanitizer {
public:
  static ValidationOutcome<std::string> sanitizeString(std::string_view input,
                                                       std::string_view field);

  static std::string escapeHtml(std::string_view input);

  // Strips leading and trailing Unicode whitespace
  static std::string trimSpace(std::string_view input);

  static bool isValidUtf8(std::string_view input);
};

} // namespace ledgerguard
