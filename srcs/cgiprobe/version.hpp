#ifndef CGIPROBE_VERSION_HPP_
#define CGIPROBE_VERSION_HPP_

#define CGIPROBE_VERSION "0.1.0"

#endif
