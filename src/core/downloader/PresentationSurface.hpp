#pragma once

/**
 * PresentationSurface.hpp
 *
 * Where requesters see the status of their downloads.
 */

#include <cstdint>
#include <string>

namespace courier::core::downloader {

/**
 * Identifies one status area on the surface (a chat message, a console row)
 */
struct SurfaceRef {
    std::string channel;
    std::int64_t messageId{0};

    bool operator==(const SurfaceRef& other) const {
        return channel == other.channel && messageId == other.messageId;
    }
    bool operator<(const SurfaceRef& other) const {
        return channel < other.channel || (channel == other.channel && messageId < other.messageId);
    }
};

enum class RenderStatus {
    Ok,
    NotModified,   // Same text already shown; harmless
    RateLimited,   // Surface is throttling us
    Failed
};

class PresentationSurface {
public:
    virtual ~PresentationSurface() = default;

    /**
     * Replace the text shown at ref. Must not throw.
     */
    virtual RenderStatus render(const SurfaceRef& ref, const std::string& text) = 0;

    /**
     * No more renders will target ref; drop whatever is kept for it
     */
    virtual void release(const SurfaceRef& ref) { (void)ref; }
};

} // namespace courier::core::downloader
