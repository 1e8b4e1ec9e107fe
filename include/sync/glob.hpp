#pragma once

#include <string_view>

namespace ms::sync {

// rsync-style wildcard match of a whole string:
//   *  any run of characters except '/'
//   ** any run of characters including '/'
//   ?  one character except '/'
//   [...] character class ([!...] / [^...] negated, a-z ranges)
//   \x literal x
bool globMatch(std::string_view pattern, std::string_view text);

}
