#pragma once

#include <string>

#include "xpratt/value.h"

namespace xpratt::render {

/// One rendered item per line, in sequence order. An empty sequence renders as "".
std::string render_plain(const Sequence& items);
/// JSON array of results; nodes become {"kind","name","path"} objects.
/// MUST keep key order stable for scripts that diff outputs.
std::string render_json(const Sequence& items);

}  // namespace xpratt::render
