#ifndef MYLOGGER_HPP
#define MYLOGGER_HPP

#include <string>

// Thin static facade over Boost.Log so call sites only deal with strings.
class MyLogger
{
public:
    // level is one of "trace", "debug", "info", "warning", "error", "fatal".
    // An empty file keeps logging on the console only.
    static void init(const std::string &level = "info", const std::string &file = "");
    static void setLevel(const std::string &level);

    static void trace(const std::string &msg);
    static void debug(const std::string &msg);
    static void info(const std::string &msg);
    static void warning(const std::string &msg);
    static void error(const std::string &msg);
};

#endif // MYLOGGER_HPP
