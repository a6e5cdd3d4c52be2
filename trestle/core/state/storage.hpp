// Copyright 2025 The Trestle Authors
// SPDX-License-Identifier: Apache-2.0

// Typed accessors to ledger storage items.
// Include after the headers declaring the codec overloads of the stored types.

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include <trestle/core/codec/decode.hpp>
#include <trestle/core/codec/encode_vector.hpp>
#include <trestle/core/common/bytes.hpp>
#include <trestle/core/state/kv_store.hpp>
#include <trestle/core/state/storage_keys.hpp>
#include <trestle/infra/common/decoding_exception.hpp>

namespace trestle::state {

namespace detail {
    template <class T>
    Bytes encode_item(const T& item) {
        Bytes encoded;
        codec::encode(encoded, item);
        return encoded;
    }

    template <class T>
    T decode_item(ByteView encoded, std::string_view item_name) {
        T item{};
        success_or_throw(codec::decode(encoded, item, codec::Leftover::kProhibit),
                         "corrupted storage item " + std::string{item_name});
        return item;
    }
}  // namespace detail

//! Single value storage item
template <class V>
class StorageValue {
  public:
    StorageValue(std::string_view module, std::string_view item)
        : name_{item}, key_{storage_prefix(module, item)} {}

    const Bytes& key() const noexcept { return key_; }

    std::optional<V> get(const KeyValueStore& store) const {
        const auto encoded{store.get(key_)};
        if (!encoded) {
            return std::nullopt;
        }
        return detail::decode_item<V>(*encoded, name_);
    }

    V get_or_default(const KeyValueStore& store) const { return get(store).value_or(V{}); }

    bool exists(const KeyValueStore& store) const { return store.contains(key_); }

    void put(KeyValueStore& store, const V& value) const { store.put(key_, detail::encode_item(value)); }

    void erase(KeyValueStore& store) const { store.erase(key_); }

  private:
    std::string name_;
    Bytes key_;
};

//! Map storage item with hashed keys
template <class K, class V>
class StorageMap {
  public:
    StorageMap(std::string_view module, std::string_view item)
        : module_{module}, name_{item}, prefix_{storage_prefix(module, item)} {}

    const Bytes& prefix() const noexcept { return prefix_; }

    Bytes key(const K& k) const { return storage_map_key(module_, name_, detail::encode_item(k)); }

    std::optional<V> get(const KeyValueStore& store, const K& k) const {
        const auto encoded{store.get(key(k))};
        if (!encoded) {
            return std::nullopt;
        }
        return detail::decode_item<V>(*encoded, name_);
    }

    V get_or_default(const KeyValueStore& store, const K& k) const { return get(store, k).value_or(V{}); }

    bool contains(const KeyValueStore& store, const K& k) const { return store.contains(key(k)); }

    void put(KeyValueStore& store, const K& k, const V& value) const {
        store.put(key(k), detail::encode_item(value));
    }

    void erase(KeyValueStore& store, const K& k) const { store.erase(key(k)); }

    //! Visits every entry of the map in storage key order
    void for_each(const KeyValueStore& store, const std::function<void(const K&, const V&)>& visitor) const {
        store.for_each_with_prefix(prefix_, [&](ByteView storage_key, ByteView encoded) {
            storage_key.remove_prefix(kStoragePrefixLength + kKeyHashLength);
            visitor(detail::decode_item<K>(storage_key, name_), detail::decode_item<V>(encoded, name_));
        });
    }

  private:
    std::string module_;
    std::string name_;
    Bytes prefix_;
};

//! Map storage item indexed by two hashed keys
template <class K1, class K2, class V>
class StorageDoubleMap {
  public:
    StorageDoubleMap(std::string_view module, std::string_view item) : module_{module}, name_{item} {}

    Bytes key(const K1& k1, const K2& k2) const {
        return storage_double_map_key(module_, name_, detail::encode_item(k1), detail::encode_item(k2));
    }

    std::optional<V> get(const KeyValueStore& store, const K1& k1, const K2& k2) const {
        const auto encoded{store.get(key(k1, k2))};
        if (!encoded) {
            return std::nullopt;
        }
        return detail::decode_item<V>(*encoded, name_);
    }

    bool contains(const KeyValueStore& store, const K1& k1, const K2& k2) const {
        return store.contains(key(k1, k2));
    }

    void put(KeyValueStore& store, const K1& k1, const K2& k2, const V& value) const {
        store.put(key(k1, k2), detail::encode_item(value));
    }

    void erase(KeyValueStore& store, const K1& k1, const K2& k2) const { store.erase(key(k1, k2)); }

  private:
    std::string module_;
    std::string name_;
};

}  // namespace trestle::state
