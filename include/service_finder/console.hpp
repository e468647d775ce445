#pragma once

#include <initializer_list>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace service_finder
{

enum class Style
{
    Plain,
    TypeNotice, // blue
    ServiceName, // green
    Address, // cyan
    DeviceName, // magenta
    Warning, // yellow
    Removal, // red
    Debug // yellow
};

// Line oriented output shared by every thread.
// Each line is written in one piece and flushed right away.
class Console
{
public:
    explicit Console(std::ostream& os, bool color = true);

    void PrintLine(Style style, std::string_view text);

    // Several differently styled segments on one line
    void PrintSegments(std::initializer_list<std::pair<Style, std::string_view>> segments);

private:
    std::string Decorate(Style style, std::string_view text) const;

    std::ostream& m_os;
    bool m_color;
    std::mutex m_mutex;
};

}
