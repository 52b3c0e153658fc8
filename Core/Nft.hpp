#pragma once

// Nft.hpp — сессия libnftables как CommandRunner.
// Вывод и ошибки буферизуются; listing печатается с handle'ами правил,
// чтобы их можно было удалять адресно ("delete rule ... handle N").

#include "Core/Command.hpp"

#include <string>

// libnftables скрыт от заголовка.
struct nft_ctx;

class NftSession final : public CommandRunner
{
public:
    NftSession();
    ~NftSession() override;

    NftSession(const NftSession&)            = delete;
    NftSession& operator=(const NftSession&) = delete;
    NftSession(NftSession&& other) noexcept;
    NftSession& operator=(NftSession&& other) noexcept;

    // Выполнить nft-скрипт (одна или несколько команд через '\n').
    CommandResult Run(const std::string &command) override;

    // Доступен ли nftables (list tables / пробная таблица).
    bool Probe();

private:
    void CreateCtx_();
    void DestroyCtx_();

private:
    nft_ctx *ctx_ = nullptr;
};
