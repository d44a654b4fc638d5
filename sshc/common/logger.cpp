
#include "logger.hpp"

#include <utility>
#include <stdio.h>

namespace securepath::sshc {

std::string_view to_string(logger::type t) {
	switch(t) {
		case logger::error: return "error";
		case logger::info: return "info";
		case logger::debug: return "debug";
		case logger::debug_verbose: return "verbose";
		case logger::debug_trace: return "trace";
		default: break;
	}
	return "log";
}

void stdout_logger::do_log_line(logger::type t, std::string const& s, std::source_location&& loc) {
	std::lock_guard lock(mutex_);
	if(verbose_prefix_) {
		std::printf("[%s] %s:%u: %s\n", to_string(t).data(), loc.file_name(), unsigned(loc.line()), s.c_str());
	} else {
		std::puts(s.c_str());
	}
}

session_logger::session_logger(logger& l, std::string tag)
: logger(l.level())
, log_(l)
, tag_(std::move(tag))
{}

void session_logger::do_log_line(logger::type t, std::string const& s, std::source_location&& loc) {
	log_.log_line(t, tag_ + s, std::move(loc));
}

}
