#pragma once

namespace fsroute::url {

// Decodes [first, last) in place, compacting percent-encoded sequences. '+' is replaced by 'plusAs'
// (use ' ' only for query string values, never for paths).
// With strictInvalid, returns nullptr on a truncated '%' or non-hex digits, leaving the buffer partially
// modified. Otherwise invalid sequences are copied literally.
// Returns a pointer to the new logical end of the decoded sequence.
char* DecodeInPlace(char* first, const char* last, char plusAs = '+', bool strictInvalid = true);

}  // namespace fsroute::url
