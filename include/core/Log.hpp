#pragma once

#include <mutex>
#include <ostream>
#include <string>

namespace dropzone {

enum class LogColor {
    None,
    Green,
    Yellow,
    Red,
    Purple,
    Dim,
};

/**
 * Console logging shared by every connection thread.
 *
 * All output goes through one mutex so lines written concurrently from
 * different connections never interleave.
 */
class Log {
public:
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // "[HH:MM:SS] TAG text" on stdout with a coloured bold tag
    static void event(const std::string& tag, LogColor color, const std::string& text);

    // Writes an already formatted block to out under the console lock
    static void write(std::ostream& out, const std::string& block);

    /**
     * Makes client-supplied text safe to print on a terminal. Control
     * characters (C0 except tab, DEL, C1) and bytes that are not valid
     * UTF-8 come out as \\xNN. Newlines are escaped too.
     */
    static std::string sanitize(const std::string& text);

    static std::string timestamp();
    static std::string paint(const std::string& text, LogColor color, bool bold = false);

    // Tests and pipes get plain text
    static void setColorEnabled(bool enabled);
    static bool colorEnabled();

private:
    static std::mutex s_mutex;
};

} // namespace dropzone
