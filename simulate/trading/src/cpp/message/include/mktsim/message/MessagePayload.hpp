/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

struct MessagePayload
{
    using Ptr = std::shared_ptr<MessagePayload>;

    virtual ~MessagePayload() noexcept = default;

    [[nodiscard]] virtual std::string toString() const = 0;

    template<typename T, typename... Args>
    requires std::derived_from<T, MessagePayload> && std::constructible_from<T, Args...>
    [[nodiscard]] static std::shared_ptr<T> create(Args&&... args)
    {
        return std::make_shared<T>(std::forward<Args>(args)...);
    }

protected:
    MessagePayload() noexcept = default;
};

//-------------------------------------------------------------------------

struct EmptyPayload : public MessagePayload
{
    using Ptr = std::shared_ptr<EmptyPayload>;

    [[nodiscard]] virtual std::string toString() const override { return "{}"; }
};

//-------------------------------------------------------------------------

struct WakeupPayload : public MessagePayload
{
    using Ptr = std::shared_ptr<WakeupPayload>;

    std::optional<std::string> tag;

    WakeupPayload() noexcept = default;
    explicit WakeupPayload(std::optional<std::string> tag) noexcept : tag{std::move(tag)} {}

    [[nodiscard]] virtual std::string toString() const override;
};

//-------------------------------------------------------------------------
