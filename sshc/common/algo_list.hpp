#ifndef SSHC_COMMON_ALGO_LIST_HEADER
#define SSHC_COMMON_ALGO_LIST_HEADER

#include "util.hpp"
#include "types.hpp"

#include <algorithm>
#include <vector>

namespace securepath::sshc {

/// Ordered preference list of algorithms of one category, no duplicates
template<typename Type>
class algo_list {
public:
	using algo_type = Type;
	using const_iterator = typename std::vector<algo_type>::const_iterator;

	algo_list() = default;
	algo_list(std::vector<algo_type> algos)
	{
		for(auto&& v : algos) {
			add_back(v);
		}
	}
	algo_list(std::initializer_list<algo_type> list)
	: algo_list(std::vector<algo_type>(list))
	{
	}

	void add_back(algo_type t) {
		if(!supports(t)) {
			algos_.push_back(t);
		}
	}

	void add_front(algo_type t) {
		remove(t);
		algos_.insert(algos_.begin(), t);
	}

	void remove(algo_type t) {
		auto it = std::find(algos_.begin(), algos_.end(), t);
		if(it != algos_.end()) {
			algos_.erase(it);
		}
	}

	void clear() {
		algos_.clear();
	}

	bool empty() const {
		return algos_.empty();
	}

	std::size_t size() const {
		return algos_.size();
	}

	algo_type front() const {
		SSHC_ASSERT(!empty(), "invalid state");
		return algos_.front();
	}

	algo_type preferred() const {
		return front();
	}

	bool supports(algo_type t) const {
		return std::find(algos_.begin(), algos_.end(), t) != algos_.end();
	}

	/// Turn the list of algorithms to ssh name-list
	std::vector<std::string_view> name_list() const {
		std::vector<std::string_view> res;
		res.reserve(algos_.size());
		for(auto&& v : algos_) {
			res.push_back(to_string(v));
		}
		return res;
	}

	/// Turn the list of algorithms to comma separated ssh name-list string
	std::string name_list_string() const {
		std::string res;
		for(auto&& v : algos_) {
			if(!res.empty()) {
				res += ",";
			}
			res += to_string(v);
		}
		return res;
	}

	const_iterator begin() const { return algos_.begin(); }
	const_iterator end() const { return algos_.end(); }

	bool operator==(algo_list const&) const = default;

private:
	std::vector<algo_type> algos_;
};

template<typename Tag> struct type_tag {};

/// Names we don't know are left out, the peer can offer anything
template<typename Type>
algo_list<Type> algo_list_from_string_list(std::vector<std::string_view> const& list) {
	algo_list<Type> ret;
	for(auto&& v : list) {
		auto t = from_string(type_tag<Type>{}, v);
		if(t != Type{}) {
			ret.add_back(t);
		}
	}
	return ret;
}

}

#endif
