#include "command_parser.hpp"

#include <ostream>

namespace securepath::sshc {

namespace {

struct flag_option : option_base {
	flag_option(bool& v) : value_(v) {}

	bool is_flag() const override { return true; }
	void parse(std::string const&) override {
		value_ = true;
	}
	void print(std::ostream& o) const override {
		o << (value_ ? "true" : "false");
	}

	bool& value_;
};

}

void command_parser::add(bool& var, std::string name, std::string alias, std::string info) {
	add_option(std::move(name), std::move(alias), std::move(info), std::make_unique<flag_option>(var));
}

void command_parser::add_option(std::string name, std::string alias, std::string info, std::unique_ptr<option_base> v) {
	auto p = std::make_shared<option>(option{std::move(name), std::move(alias), std::move(info), std::move(v)});
	if(!p->name.empty()) {
		lookup_.insert({"--" + p->name, p});
	}
	if(!p->alias.empty()) {
		lookup_.insert({"-" + p->alias, p});
	}
	options_.push_back(std::move(p));
}

option& command_parser::find(std::string const& arg) {
	auto it = lookup_.find(arg);
	if(it == lookup_.end()) {
		throw invalid_argument("no option named '" + arg + "'");
	}
	return *it->second;
}

void command_parser::parse(int argc, char const* const argv[]) {
	parse(std::vector<std::string>(argv + 1, argv + argc));
}

void command_parser::parse(std::vector<std::string> const& args) {
	for(std::size_t i = 0; i != args.size(); ++i) {
		std::string const& arg = args[i];
		if(arg.size() < 2 || arg[0] != '-') {
			positionals_.push_back(arg);
			continue;
		}

		auto eq = arg.find('=');
		if(eq != std::string::npos) {
			option& o = find(arg.substr(0, eq));
			if(o.value->is_flag()) {
				throw invalid_argument("option '" + o.name + "' takes no value");
			}
			o.value->parse(arg.substr(eq + 1));
			continue;
		}

		option& o = find(arg);
		if(o.value->is_flag()) {
			o.value->parse({});
		} else {
			if(i + 1 == args.size()) {
				throw invalid_argument("missing value for '" + arg + "'");
			}
			o.value->parse(args[++i]);
		}
	}
}

void command_parser::print_help(std::ostream& out) const {
	std::size_t const column = 32;
	for(auto&& o : options_) {
		std::string head = "  --" + o->name;
		if(!o->alias.empty()) {
			head += ", -" + o->alias;
		}
		if(head.size() < column) {
			head.resize(column, ' ');
		} else {
			head += ' ';
		}

		std::ostringstream value;
		o->value->print(value);

		out << head << o->info;
		if(!value.str().empty()) {
			out << " (" << value.str() << ")";
		}
		out << "\n";
	}
}

}
