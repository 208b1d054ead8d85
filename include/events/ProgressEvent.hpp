#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace collagist::events {

struct ProgressEvent {
    enum class Type {
        DirectoryCreated,  // Missing input or output directory was made; data = path
        NoImages,          // Scan found nothing; data = directory
        CollageStarted,    // total = image count, data = "WxH" canvas size
        ImageStarted,      // index/total, data = file name
        ImageSkipped,      // index/total, data = file name, reason set
        CollageSaved,      // data = output path
    };
    Type type;
    std::size_t index = 0;    // 1-based for display
    std::size_t total = 0;
    std::string data;
    std::string reason;
};

using ProgressHandler = std::function<void(const ProgressEvent&)>;

}  // namespace collagist::events
