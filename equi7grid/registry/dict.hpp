/**
 * Copyright (c) 2017 Melown Technologies SE
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * *  Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * *  Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED.  IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */
/**
 * \file registry/dict.hpp
 */

#ifndef equi7grid_registry_dict_hpp_included_
#define equi7grid_registry_dict_hpp_included_

#include <map>
#include <new>
#include <string>

#include "dbglog/dbglog.hpp"

#include "../error.hpp"

namespace equi7grid { namespace registry {

/** Dictionary of registry items keyed by their string id. Lookup of unknown
 *  id throws NotFound.
 */
template <typename T, typename NotFound = Error>
class StringDictionary
{
private:
    typedef std::map<std::string, T> map;

public:
    StringDictionary() {}

    void set(const std::string &id, const T &value);
    const T* get(const std::string &id, std::nothrow_t) const;
    const T& get(const std::string &id) const;
    bool has(const std::string &id) const;

    void add(const T &value) { set(value.id, value); }

    typedef typename map::value_type value_type;
    typedef typename map::const_iterator const_iterator;
    const_iterator begin() const { return map_.begin(); }
    const_iterator end() const { return map_.end(); }

    bool empty() const { return map_.empty(); }
    std::size_t size() const { return map_.size(); }

    const T* operator()(const std::string &id, std::nothrow_t) const {
        return get(id, std::nothrow);
    }
    const T& operator()(const std::string &id) const { return get(id); }

private:
    map map_;
};

template <typename T, typename NotFound>
void StringDictionary<T, NotFound>::set(const std::string &id, const T &value)
{
    map_.insert(typename map::value_type(id, value));
}

template <typename T, typename NotFound>
const T* StringDictionary<T, NotFound>::get(const std::string &id
                                            , std::nothrow_t) const
{
    auto fmap(map_.find(id));
    if (fmap == map_.end()) { return nullptr; }
    return &fmap->second;
}

template <typename T, typename NotFound>
const T& StringDictionary<T, NotFound>::get(const std::string &id) const
{
    const auto *value(get(id, std::nothrow));
    if (!value) {
        LOGTHROW(err1, NotFound)
            << "<" << id << "> is not known " << T::typeName << ".";
    }
    return *value;
}

template <typename T, typename NotFound>
bool StringDictionary<T, NotFound>::has(const std::string &id) const
{
    return (map_.find(id) != map_.end());
}

} } // namespace equi7grid::registry

#endif // equi7grid_registry_dict_hpp_included_
