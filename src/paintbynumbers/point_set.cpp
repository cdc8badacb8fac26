#include "point_set.hpp"
#include <stdexcept>

pbn::path_table::path_table() {
}

void pbn::path_table::insert(path_ref path, int index) {
    impl_[detail::path_key(make_path_id(path))] = { index, false };
    impl_[detail::path_key(make_reverse_path_id(path))] = { index, true };
}

std::optional<pbn::path_table::entry> pbn::path_table::find(path_ref path) const {
    auto iter = impl_.find(detail::path_key(make_path_id(path)));
    if (iter == impl_.end()) {
        return {};
    } else {
        return iter->second;
    }
}

bool pbn::path_table::contains(path_ref path) const {
    return impl_.find(detail::path_key(make_path_id(path))) != impl_.end();
}

size_t pbn::path_table::size() const {
    return impl_.size();
}

pbn::path_table::path_id pbn::make_path_id(std::span<const int_point> path)
{
    if (path.size() < 2) {
        throw std::runtime_error("bad path");
    }
    return { path.front(), path[1], path.back() };
}

pbn::path_table::path_id pbn::make_reverse_path_id(std::span<const int_point> path)
{
    if (path.size() < 2) {
        throw std::runtime_error("bad path");
    }
    return { path.back(), path[path.size() - 2], path.front() };
}
