#include <cstring>
#include <sklib/debug.hh>

std::string errmsg(int errnum) {
    char buff[128];
    // GNU strerror_r() may return a static string instead of filling buff
    const char* description = strerror_r(errnum, buff, sizeof(buff));
    return concat_tostr(" - ", description, " (os error ", errnum, ')');
}
