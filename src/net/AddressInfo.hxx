// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <utility>

#include <netdb.h>

/**
 * Owner of a linked list of "struct addrinfo" returned by
 * getaddrinfo().
 */
class AddressInfoList {
	struct addrinfo *value = nullptr;

public:
	AddressInfoList() noexcept = default;
	explicit AddressInfoList(struct addrinfo *_value) noexcept
		:value(_value) {}

	AddressInfoList(AddressInfoList &&src) noexcept
		:value(std::exchange(src.value, nullptr)) {}

	~AddressInfoList() noexcept {
		if (value != nullptr)
			freeaddrinfo(value);
	}

	AddressInfoList &operator=(AddressInfoList &&src) noexcept {
		std::swap(value, src.value);
		return *this;
	}

	bool empty() const noexcept {
		return value == nullptr;
	}

	class const_iterator {
		const struct addrinfo *cursor;

	public:
		explicit constexpr const_iterator(const struct addrinfo *_cursor) noexcept
			:cursor(_cursor) {}

		constexpr bool operator==(const const_iterator &) const noexcept = default;

		const_iterator &operator++() noexcept {
			cursor = cursor->ai_next;
			return *this;
		}

		const struct addrinfo &operator*() const noexcept {
			return *cursor;
		}

		const struct addrinfo *operator->() const noexcept {
			return cursor;
		}
	};

	const_iterator begin() const noexcept {
		return const_iterator(value);
	}

	const_iterator end() const noexcept {
		return const_iterator(nullptr);
	}
};
