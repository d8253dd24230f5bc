#pragma once

#include <pformat/lang/template.hpp>
#include <pformat/resolver.hpp>
#include <string>

namespace pformat {

struct RenderOptions {
    std::string glob_marker = "*";
    // Write literal braces back as "{{" / "}}" so the output stays a valid
    // template for a later pass
    bool escape_literals = false;
};

// Concatenate literal segments and resolved fields in template order.
Result<std::string> render(const Template& tmpl,
                           Mode mode,
                           const Bindings& bindings,
                           const RenderOptions& opts = {});

} // namespace pformat
