// Courier - Console Surface
// Shows download status text on a terminal

#pragma once

#include "../core/downloader/PresentationSurface.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <ostream>
#include <string>

namespace courier::ui {

/**
 * @brief Presentation surface that prints status text to a stream
 *
 * Each SurfaceRef is one status area; a render prints the new text under
 * a "[channel#id]" tag. Repeating the text already shown for a ref prints
 * nothing and reports NotModified. Released refs are forgotten.
 */
class ConsoleSurface : public core::downloader::PresentationSurface {
public:
    explicit ConsoleSurface(std::ostream& out);

    core::downloader::RenderStatus render(const core::downloader::SurfaceRef& ref,
                                          const std::string& text) override;

    void release(const core::downloader::SurfaceRef& ref) override;

    // Allocate a fresh status area on this surface
    core::downloader::SurfaceRef newRef(const std::string& channel = "console");

    // Text last shown at ref, empty if none
    std::string lastText(const core::downloader::SurfaceRef& ref) const;

    // Number of refs whose last text is remembered
    size_t tracked() const;

    // Print a line that is not tied to a status area
    void println(const std::string& line);

private:
    std::ostream& m_out;
    mutable std::mutex m_mutex;
    std::map<core::downloader::SurfaceRef, std::string> m_shown;
    std::int64_t m_nextId{1};
};

} // namespace courier::ui
