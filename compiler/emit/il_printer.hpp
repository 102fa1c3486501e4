#pragma once

#include "../common/diagnostic.hpp"
#include "../metadata/model.hpp"

#include <iosfwd>
#include <vector>

namespace metatext::emit
{
    // Writes the IL assembly text for the collected metadata. Returns false and
    // appends render diagnostics when the model cannot be expressed; the stream
    // contents are incomplete in that case.
    [[nodiscard]] bool printIl(const metadata::Metadata& metadata,
        std::ostream& stream,
        std::vector<common::Diagnostic>& diagnostics);
} // namespace metatext::emit
