#pragma once

#include <string>

namespace reposcope::engine {

    /**
     * @brief Maps a file path to a language tag by extension (or well-known file name).
     * @return The tag, or "text" when nothing matches.
     */
    std::string classify_language(const std::string& path);

}
