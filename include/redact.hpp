// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

namespace homewizard {

/// \brief Replace every occurrence of \p secret in \p text before it reaches a log sink.
inline std::string redact(std::string text, const std::string& secret) {
    if (secret.empty()) {
        return text;
    }
    const std::string mask = "***";
    std::size_t pos = 0;
    while ((pos = text.find(secret, pos)) != std::string::npos) {
        text.replace(pos, secret.size(), mask);
        pos += mask.size();
    }
    return text;
}

} // namespace homewizard
