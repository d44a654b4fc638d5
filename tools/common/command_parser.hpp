#ifndef SSHC_TOOLS_COMMON_COMMAND_PARSER_HEADER
#define SSHC_TOOLS_COMMON_COMMAND_PARSER_HEADER

#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace securepath::sshc {

struct invalid_argument : std::runtime_error {
	using std::runtime_error::runtime_error;
};

struct option_base {
	virtual ~option_base() = default;
	/// true if the option is given without value (--flag)
	virtual bool is_flag() const { return false; }
	virtual void parse(std::string const& value) = 0;
	virtual void print(std::ostream&) const = 0;
};

struct option {
	std::string name;
	std::string alias;
	std::string info;
	std::unique_ptr<option_base> value;
};

/** \brief Command line options of the form --name value, --name=value or -a value
 *
 *  Everything else is collected as positional argument in the given order.
 */
class command_parser {
public:
	template<typename T>
	void add(T& var, std::string name, std::string alias, std::string info);
	template<typename T>
	void add(std::optional<T>& var, std::string name, std::string alias, std::string info);
	void add(bool& var, std::string name, std::string alias, std::string info);

	void parse(int argc, char const* const argv[]);
	void parse(std::vector<std::string> const& args);

	std::vector<std::string> const& positionals() const { return positionals_; }

	void print_help(std::ostream&) const;

private:
	void add_option(std::string name, std::string alias, std::string info, std::unique_ptr<option_base>);
	option& find(std::string const& arg);

private:
	std::vector<std::shared_ptr<option>> options_;
	std::map<std::string, std::shared_ptr<option>> lookup_;
	std::vector<std::string> positionals_;
};

template<typename T>
void read_value(std::string const& s, T& out) {
	if constexpr(std::is_same_v<std::string, T>) {
		out = s;
	} else {
		std::istringstream in(s);
		if(!(in >> out) || !(in >> std::ws).eof()) {
			throw invalid_argument("failed to interpret argument '" + s + "'");
		}
	}
}

template<typename T>
struct value_option : option_base {
	value_option(T& v) : value_(v) {}

	void parse(std::string const& v) override {
		read_value(v, value_);
	}
	void print(std::ostream& o) const override {
		o << value_;
	}

	T& value_;
};

template<typename T>
struct optional_option : option_base {
	optional_option(std::optional<T>& v) : value_(v) {}

	void parse(std::string const& v) override {
		read_value(v, value_.emplace());
	}
	void print(std::ostream& o) const override {
		if(value_) {
			o << *value_;
		}
	}

	std::optional<T>& value_;
};

template<typename T>
void command_parser::add(T& var, std::string name, std::string alias, std::string info) {
	add_option(std::move(name), std::move(alias), std::move(info), std::make_unique<value_option<T>>(var));
}

template<typename T>
void command_parser::add(std::optional<T>& var, std::string name, std::string alias, std::string info) {
	add_option(std::move(name), std::move(alias), std::move(info), std::make_unique<optional_option<T>>(var));
}

}

#endif
