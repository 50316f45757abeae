// err.cc
//
// flexible error reporting, using a printf-style interface and
// syslog-style severity levels

#include <stdarg.h>
#include <stdio.h>
#include <string>
#include "err.h"

int printf_err_func(log_level level, const char *format, ...) {

    // output error level message
    //
    const char *msg = "";
    switch(level) {
    case log_emerg:   msg = "emergency: ";     break;
    case log_alert:   msg = "alert: ";         break;
    case log_crit:    msg = "critical: ";      break;
    case log_err:     msg = "error: ";         break;
    case log_warning: msg = "warning: ";       break;
    case log_notice:  msg = "notice: ";        break;
    case log_info:    msg = "informational: "; break;
    case log_debug:   msg = "debug: ";         break;
    case log_none:  break;  // leave msg empty
    }
    int retval = fprintf(stderr, "%s", msg);

    // output formatted argument list
    //
    va_list args;
    va_start(args, format);
    retval += vfprintf(stderr, format, args);
    va_end(args);

    return retval;
}

static int silent_err_func(log_level, const char *, ...) {
    return 0;
}

static printf_err_ptr printf_err_callback = printf_err_func;

static log_level log_threshold = log_warning;

void register_printf_err_callback(printf_err_ptr callback) {

    if (callback == nullptr) {
        printf_err_callback = silent_err_func;
    } else {
        printf_err_callback = callback;
    }
}

void set_log_threshold(log_level threshold) {
    log_threshold = threshold;
}

log_level get_log_threshold() {
    return log_threshold;
}

int printf_err(log_level level, const char *format, ...) {
    if (level > log_threshold && level != log_none) {
        return 0;
    }

    // format the message first, since a va_list cannot be forwarded
    // to a variadic callback
    //
    va_list args;
    va_start(args, format);
    va_list args_copy;
    va_copy(args_copy, args);
    int len = vsnprintf(nullptr, 0, format, args_copy);
    va_end(args_copy);
    if (len < 0) {
        va_end(args);
        return len;
    }
    std::string message(static_cast<size_t>(len), '\0');
    vsnprintf(&message[0], message.size() + 1, format, args);
    va_end(args);

    return printf_err_callback(level, "%s", message.c_str());
}
