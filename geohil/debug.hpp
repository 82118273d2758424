// -*- C++ -*-
#ifndef _GEOHIL_DEBUG_HPP_
#define _GEOHIL_DEBUG_HPP_

#include <cstring>
#include <iomanip>
#include <iostream>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Initializers/ConsoleInitializer.h>
#include <plog/Log.h>
#include <tinyformat.h>

//
// error message printing
//
#define ERROR PLOG(plog::error)
#define ERROR_IF(condition) PLOG_IF(plog::error, (condition))

#ifndef DISABLE_DEBUG
//
// enable debug message printing
//
#define DEBUG0 PLOG(plog::info)
#define DEBUG1 PLOG(plog::debug)
#define DEBUG2 PLOG(plog::verbose)
#define DEBUG_IF0(condition) PLOG_IF(plog::info, (condition))
#define DEBUG_IF1(condition) PLOG_IF(plog::debug, (condition))
#define DEBUG_IF2(condition) PLOG_IF(plog::verbose, (condition))
#else
//
// disable debug message printing
//
#define DEBUG0 PLOG_IF(plog::verbose, false)
#define DEBUG1 PLOG_IF(plog::verbose, false)
#define DEBUG2 PLOG_IF(plog::verbose, false)
#define DEBUG_IF0(condition) PLOG_IF(plog::verbose, false)
#define DEBUG_IF1(condition) PLOG_IF(plog::verbose, false)
#define DEBUG_IF2(condition) PLOG_IF(plog::verbose, false)
#endif

namespace plog
{
//
// custom formatter for library diagnostics
//
class DebugFormatter
{
public:
  static util::nstring header()
  {
    return util::nstring();
  }

  static util::nstring format(const Record& record)
  {
    static const char* message[] = {"------", "FATAL!", "ERROR!", "WARN!",
                                    "DEBUG0", "DEBUG1", "DEBUG2"};

    util::nostringstream ss;

    ss << std::setfill(PLOG_NSTR(' ')) << std::setw(6) << std::left << message[record.getSeverity()]
       << PLOG_NSTR(" geohil");
    ss << PLOG_NSTR("[") << record.getFunc() << PLOG_NSTR("@") << record.getLine()
       << PLOG_NSTR("] ");
    ss << record.getMessage() << PLOG_NSTR("\n");

    return ss.str();
  }
};
} // namespace plog

//
// utility for diagnostic message printing
//
// Nothing is printed by the library until init() has been called. A negative level
// silences all messages including errors.
//
class DebugPrinter
{
public:
  static void init(int level = 0)
  {
    static plog::ConsoleAppender<plog::DebugFormatter> consoleAppender(plog::streamStdErr);
    plog::init(plog::verbose, &consoleAppender);
    set_level(level);
  }

  static void set_level(int level = 0)
  {
    if (plog::get() == nullptr) {
      return;
    }

    if (level < 0) {
      plog::get()->setMaxSeverity(plog::none);
    } else if (level == 0) {
      plog::get()->setMaxSeverity(plog::info);
    } else if (level == 1) {
      plog::get()->setMaxSeverity(plog::debug);
    } else {
      plog::get()->setMaxSeverity(plog::verbose);
    }
  }
};

// Local Variables:
// c-file-style   : "gnu"
// c-file-offsets : ((innamespace . 0) (inline-open . 0))
// End:
#endif
