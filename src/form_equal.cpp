// Structural equality + deep clone for forms.
#include "ntup/form.hpp"
#include <vector>

namespace ntup {

static bool equal_impl(const node_ptr& a, const node_ptr& b, bool ignore_meta) {
	if (a.get() == b.get()) return true;
	if (!a || !b) return false;
	if (a->data.index() != b->data.index()) return false;

	if (!ignore_meta) {
		if (a->metadata.size() != b->metadata.size()) return false;
		for (const auto& kv : a->metadata) {
			auto it = b->metadata.find(kv.first);
			if (it == b->metadata.end()) return false;
			if (!equal_impl(kv.second, it->second, ignore_meta)) return false;
		}
	}

	struct Visitor {
		const node_ptr& a; const node_ptr& b; bool ignore_meta;
		static bool seq(const std::vector<node_ptr>& le, const std::vector<node_ptr>& re, bool ig) {
			if (le.size() != re.size()) return false;
			for (size_t i = 0; i < le.size(); ++i) if (!equal_impl(le[i], re[i], ig)) return false;
			return true;
		}
		bool operator()(std::monostate) const { return true; }
		bool operator()(bool) const { return std::get<bool>(a->data) == std::get<bool>(b->data); }
		bool operator()(int64_t) const { return std::get<int64_t>(a->data) == std::get<int64_t>(b->data); }
		bool operator()(double) const { return std::get<double>(a->data) == std::get<double>(b->data); }
		bool operator()(const std::string&) const { return std::get<std::string>(a->data) == std::get<std::string>(b->data); }
		bool operator()(const keyword&) const { return std::get<keyword>(a->data).name == std::get<keyword>(b->data).name; }
		bool operator()(const symbol&) const { return std::get<symbol>(a->data).name == std::get<symbol>(b->data).name; }
		bool operator()(const list&) const { return seq(std::get<list>(a->data).elems, std::get<list>(b->data).elems, ignore_meta); }
		bool operator()(const vector_t&) const { return seq(std::get<vector_t>(a->data).elems, std::get<vector_t>(b->data).elems, ignore_meta); }
		// Association lists compare in order: duplicates and ordering are significant.
		bool operator()(const map&) const {
			const auto& lm = std::get<map>(a->data).entries;
			const auto& rm = std::get<map>(b->data).entries;
			if (lm.size() != rm.size()) return false;
			for (size_t i = 0; i < lm.size(); ++i) {
				if (!equal_impl(lm[i].first, rm[i].first, ignore_meta) || !equal_impl(lm[i].second, rm[i].second, ignore_meta)) return false;
			}
			return true;
		}
		bool operator()(const tagged_value&) const {
			const auto& lt = std::get<tagged_value>(a->data);
			const auto& rt = std::get<tagged_value>(b->data);
			return lt.tag.name == rt.tag.name && equal_impl(lt.inner, rt.inner, ignore_meta);
		}
	};

	return std::visit(Visitor{a, b, ignore_meta}, a->data);
}

bool equal(const node_ptr& a, const node_ptr& b, bool ignore_metadata) { return equal_impl(a, b, ignore_metadata); }

node_ptr clone(const node_ptr& n) {
	if (!n) return nullptr;
	auto out = std::make_shared<node>();
	out->metadata = n->metadata;
	std::visit([&](auto&& arg) {
		using T = std::decay_t<decltype(arg)>;
		if constexpr (std::is_same_v<T, list>) { list l; l.elems.reserve(arg.elems.size()); for (auto& ch : arg.elems) l.elems.push_back(clone(ch)); out->data = std::move(l); }
		else if constexpr (std::is_same_v<T, vector_t>) { vector_t v; v.elems.reserve(arg.elems.size()); for (auto& ch : arg.elems) v.elems.push_back(clone(ch)); out->data = std::move(v); }
		else if constexpr (std::is_same_v<T, map>) { map m; m.entries.reserve(arg.entries.size()); for (auto& kv : arg.entries) m.entries.emplace_back(clone(kv.first), clone(kv.second)); out->data = std::move(m); }
		else if constexpr (std::is_same_v<T, tagged_value>) { out->data = tagged_value{ arg.tag, clone(arg.inner) }; }
		else { out->data = arg; }
	}, n->data);
	return out;
}

} // namespace ntup
