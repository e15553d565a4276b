/**
 * ConsoleSurface.cpp
 */

#include "ConsoleSurface.hpp"
#include "../core/Logger.hpp"

#include <sstream>

namespace courier::ui {

using core::downloader::RenderStatus;
using core::downloader::SurfaceRef;

ConsoleSurface::ConsoleSurface(std::ostream& out)
    : m_out(out) {
}

RenderStatus ConsoleSurface::render(const SurfaceRef& ref, const std::string& text) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_shown.find(ref);
    if (it != m_shown.end() && it->second == text) {
        return RenderStatus::NotModified;
    }

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        m_out << "[" << ref.channel << "#" << ref.messageId << "] " << line << "\n";
    }
    m_out.flush();

    if (!m_out) {
        core::Logger::instance().warn("Console output failed for {}#{}", ref.channel, ref.messageId);
        m_out.clear();
        return RenderStatus::Failed;
    }

    m_shown[ref] = text;
    return RenderStatus::Ok;
}

void ConsoleSurface::release(const SurfaceRef& ref) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_shown.erase(ref);
}

size_t ConsoleSurface::tracked() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shown.size();
}

SurfaceRef ConsoleSurface::newRef(const std::string& channel) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return SurfaceRef{channel, m_nextId++};
}

std::string ConsoleSurface::lastText(const SurfaceRef& ref) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_shown.find(ref);
    return it != m_shown.end() ? it->second : std::string();
}

void ConsoleSurface::println(const std::string& line) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out << line << std::endl;
}

} // namespace courier::ui
