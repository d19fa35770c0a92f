/* This file is part of Daedalus Turbo project: https://github.com/sierkov/daedalus-turbo/
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * https://github.com/sierkov/daedalus-turbo/blob/main/LICENSE */
#ifndef LEDGER_CORE_LEDGER_UPDATE_QUEUE_HPP
#define LEDGER_CORE_LEDGER_UPDATE_QUEUE_HPP

#include <concepts>
#include <lc/codec/binary.hpp>
#include <lc/json.hpp>
#include <lc/ledger/types.hpp>

namespace ledger_core::ledger {
    template<typename T>
    concept update_payload = std::equality_comparable<T> && requires(const T &v, codec::encoder &enc, codec::decoder &dec, const json::value &j) {
        { v.to_bytes(enc) };
        { T::from_bytes(dec) } -> std::same_as<T>;
        { v.to_json() } -> std::convertible_to<json::value>;
        { T::from_json(j) } -> std::same_as<T>;
    };

    template<update_payload T>
    uint8_vector payload_bytes(const T &v)
    {
        codec::encoder enc {};
        v.to_bytes(enc);
        return enc.take();
    }

    template<update_payload T>
    crypto::sha2::hash_256 payload_hash(const T &v)
    {
        return crypto::sha2::digest(payload_bytes(v));
    }

    template<update_payload E>
    struct update_queue {
        using value_type = E;

        struct entry {
            transaction_time effective_time = 0;
            E update {};

            bool operator==(const entry &o) const =default;
        };
        using entry_list = vector<entry>;

        update_sequence_number next_sequence_number = min_update_sequence_number;
        // strictly ascending by effective time
        entry_list entries {};

        // Entries effective at or after t are superseded by the new one
        void enqueue(const transaction_time t, E update)
        {
            auto it = entries.begin();
            while (it != entries.end() && it->effective_time < t)
                ++it;
            entries.erase(it, entries.end());
            entries.push_back(entry { t, std::move(update) });
            ++next_sequence_number;
        }

        entry_list dequeue_due(const transaction_time now)
        {
            auto it = entries.begin();
            while (it != entries.end() && it->effective_time <= now)
                ++it;
            entry_list due { std::make_move_iterator(entries.begin()), std::make_move_iterator(it) };
            entries.erase(entries.begin(), it);
            return due;
        }

        bool empty() const noexcept
        {
            return entries.empty();
        }

        size_t size() const noexcept
        {
            return entries.size();
        }

        void to_bytes(codec::encoder &enc) const
        {
            enc.u64(next_sequence_number);
            for (const auto &e: entries) {
                enc.u8(1);
                enc.u64(e.effective_time);
                e.update.to_bytes(enc);
            }
            enc.u8(0);
        }

        static update_queue from_bytes(codec::decoder &dec)
        {
            update_queue q {};
            q.next_sequence_number = dec.u64();
            for (;;) {
                switch (const auto marker = dec.u8(); marker) {
                    case 0:
                        return q;
                    case 1: {
                        const auto t = dec.u64();
                        if (!q.entries.empty() && q.entries.back().effective_time >= t) [[unlikely]]
                            throw codec::decode_error(fmt::format("Update queue not in ascending order: {} after {}", t, q.entries.back().effective_time));
                        q.entries.push_back(entry { t, E::from_bytes(dec) });
                        break;
                    }
                    default:
                        throw codec::decode_error(fmt::format("Invalid update queue: unexpected marker {}", marker));
                }
            }
        }

        crypto::sha2::hash_256 hash() const
        {
            codec::encoder enc {};
            enc.u64(next_sequence_number);
            enc.u64(entries.size());
            for (const auto &e: entries) {
                enc.u64(e.effective_time);
                enc.bytes(payload_hash(e.update));
            }
            return crypto::sha2::digest(enc.data());
        }

        json::object to_json() const
        {
            json::array queue {};
            for (const auto &e: entries) {
                queue.emplace_back(json::object {
                    { "effectiveTime", e.effective_time },
                    { "update", e.update.to_json() }
                });
            }
            return json::object {
                { "nextSequenceNumber", next_sequence_number },
                { "queue", std::move(queue) }
            };
        }

        static update_queue from_json(const json::value &j)
        {
            if (!j.is_object()) [[unlikely]]
                throw error(fmt::format("an update queue must be a JSON object but got: {}", json::serialize(j)));
            const auto &obj = j.get_object();
            update_queue q {};
            q.next_sequence_number = json::field_uint<update_sequence_number>(obj, "nextSequenceNumber");
            for (const auto &item: json::field_array(obj, "queue")) {
                if (!item.is_object()) [[unlikely]]
                    throw error(fmt::format("an update queue entry must be a JSON object but got: {}", json::serialize(item)));
                const auto &item_obj = item.get_object();
                const auto t = json::field_uint<transaction_time>(item_obj, "effectiveTime");
                if (!q.entries.empty() && q.entries.back().effective_time >= t) [[unlikely]]
                    throw error(fmt::format("update queue entries are not in ascending order: {} after {}", t, q.entries.back().effective_time));
                q.entries.push_back(entry { t, E::from_json(json::field(item_obj, "update")) });
            }
            return q;
        }

        bool operator==(const update_queue &o) const =default;
    };
}

#endif // !LEDGER_CORE_LEDGER_UPDATE_QUEUE_HPP
