#include "service_finder/console.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

namespace service_finder
{

namespace
{

fmt::text_style StyleFor(Style style)
{
    switch (style) {
        case Style::TypeNotice: return fmt::fg(fmt::terminal_color::blue);
        case Style::ServiceName: return fmt::fg(fmt::terminal_color::green);
        case Style::Address: return fmt::fg(fmt::terminal_color::cyan);
        case Style::DeviceName: return fmt::fg(fmt::terminal_color::magenta);
        case Style::Warning: return fmt::fg(fmt::terminal_color::yellow);
        case Style::Removal: return fmt::fg(fmt::terminal_color::red);
        case Style::Debug: return fmt::fg(fmt::terminal_color::yellow);
        case Style::Plain: break;
    }
    return fmt::text_style();
}

}

Console::Console(std::ostream& os, bool color)
: m_os(os)
, m_color(color)
{}

std::string Console::Decorate(Style style, std::string_view text) const
{
    if (!m_color || style == Style::Plain) {
        return std::string(text);
    }
    return fmt::format(StyleFor(style), "{}", text);
}

void Console::PrintLine(Style style, std::string_view text)
{
    const auto line = Decorate(style, text);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_os << line << std::endl;
}

void Console::PrintSegments(std::initializer_list<std::pair<Style, std::string_view>> segments)
{
    std::string line;
    for (const auto& segment : segments) {
        line += Decorate(segment.first, segment.second);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_os << line << std::endl;
}

}
