#pragma once

#include <filesystem>

namespace reposcope::platform {

    /**
     * @brief System-level helper functions.
     * Each returns an empty path when neither the XDG variable nor HOME is set.
     */
    namespace system {
        std::filesystem::path get_config_dir();
        std::filesystem::path get_data_dir();
        std::filesystem::path get_cache_dir();
    }

}
