#include "cbu/upload/types.hpp"

#include <type_traits>

namespace cbu::upload {

std::string describe(const UploadStatus& status) {
    return std::visit([](const auto& s) -> std::string {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, Idle>) {
            return "Idle";
        } else if constexpr (std::is_same_v<T, Uploading>) {
            return "Uploading " + std::to_string(s.progress.percent_complete()) + "%";
        } else if constexpr (std::is_same_v<T, UploadSucceeded>) {
            return std::string(s.deduplicated ? "Already uploaded: " : "Uploaded: ") + s.file_name;
        } else if constexpr (std::is_same_v<T, UploadFailed>) {
            return "Failed: " + s.error.summary();
        } else {
            return "Sign-in required" + (s.auth_challenge.empty() ? std::string() : ": " + s.auth_challenge);
        }
    }, status);
}

} // namespace cbu::upload
