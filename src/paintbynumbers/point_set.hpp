#pragma once

#include "geometry.hpp"
#include <unordered_map>
#include <optional>
#include <span>
#include <tuple>
#include <boost/functional/hash.hpp>

namespace pbn {

    namespace detail {

        class path_key {

            friend struct path_key_hasher;

        public:

            path_key(const int_point& u, const int_point& m, const int_point& v) :
                u_(u), m_(m), v_(v)
            {}

            path_key(const std::tuple<int_point, int_point, int_point>& pid) :
                path_key(std::get<0>(pid), std::get<1>(pid), std::get<2>(pid))
            {}

            bool operator==(const path_key& other) const
            {
                return u_ == other.u_ && m_ == other.m_ && v_ == other.v_;
            }

        private:
            int_point u_;
            int_point m_;
            int_point v_;
        };

        struct path_key_hasher
        {
            size_t operator()(const path_key& key) const {
                size_t seed = 0;

                boost::hash_combine(seed, key.u_.x);
                boost::hash_combine(seed, key.u_.y);
                boost::hash_combine(seed, key.m_.x);
                boost::hash_combine(seed, key.m_.y);
                boost::hash_combine(seed, key.v_.x);
                boost::hash_combine(seed, key.v_.y);

                return seed;
            }
        };
    }

    // lattice paths between junction vertices, keyed by their first, second,
    // and last vertex. A path and its reversal are both entered so that the
    // facet on the other side of a border finds it walking the opposite way.
    class path_table {
    public:
        struct entry {
            int index;
            bool reversed;
        };

        using path_ref = std::span<const int_point>;
        using path_id = std::tuple<int_point, int_point, int_point>;

        path_table();
        void insert(path_ref path, int index);
        std::optional<entry> find(path_ref path) const;
        bool contains(path_ref path) const;
        size_t size() const;

    private:
        std::unordered_map<detail::path_key, entry, detail::path_key_hasher> impl_;
    };

    path_table::path_id make_path_id(std::span<const int_point> path);
    path_table::path_id make_reverse_path_id(std::span<const int_point> path);
}
