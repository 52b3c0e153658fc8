#include "Core/Nft.hpp"
#include "Core/Logger.hpp"

#include <stdexcept>

#include <nftables/libnftables.h>

NftSession::NftSession()
{
    CreateCtx_();
}

NftSession::~NftSession()
{
    DestroyCtx_();
}

NftSession::NftSession(NftSession&& o) noexcept
{
    ctx_ = o.ctx_;
    o.ctx_ = nullptr;
}

NftSession& NftSession::operator=(NftSession&& o) noexcept
{
    if (this == &o) return *this;
    DestroyCtx_();
    ctx_ = o.ctx_;
    o.ctx_ = nullptr;
    return *this;
}

void NftSession::CreateCtx_()
{
    ctx_ = nft_ctx_new(NFT_CTX_DEFAULT);
    if (!ctx_) throw std::runtime_error("libnftables: nft_ctx_new failed");

    nft_ctx_buffer_output(ctx_);
    nft_ctx_buffer_error(ctx_);
    // handle'ы нужны для адресного удаления правил
    nft_ctx_output_set_flags(ctx_, nft_ctx_output_get_flags(ctx_) | NFT_CTX_OUTPUT_HANDLE);
}

void NftSession::DestroyCtx_()
{
    if (ctx_)
    {
        nft_ctx_unbuffer_output(ctx_);
        nft_ctx_unbuffer_error(ctx_);
        nft_ctx_free(ctx_);
        ctx_ = nullptr;
    }
}

CommandResult NftSession::Run(const std::string &command)
{
    CommandResult res;
    if (!ctx_)
    {
        LOGE("nft") << "session has no context (moved-from)";
        return res;
    }

    const int rc = nft_run_cmd_from_buffer(ctx_, command.c_str());

    const char *out = nft_ctx_get_output_buffer(ctx_);
    if (out) res.output = out;
    res.exit_code = (rc == 0) ? 0 : 1;

    if (rc != 0)
    {
        const char *err = nft_ctx_get_error_buffer(ctx_);
        LOGD("nft") << "nft cmd failed rc=" << rc << ": " << command;
        LOGD("nft") << "nft stderr: " << (err && *err ? err : "(no error text)");
    }
    else
    {
        LOGT("nft") << "nft ok: " << command;
    }
    return res;
}

bool NftSession::Probe()
{
    LOGT("nft") << "probe: probing nftables";
    CommandResult r = Run("list tables");
    if (!r.Ok())
    {
        (void) Run("add table ip portforge_probe");
        r = Run("delete table ip portforge_probe");
    }

    if (!r.Ok())
    {
        LOGW("nft") << "probe: nftables not available";
        return false;
    }
    LOGD("nft") << "probe: nftables OK";
    return true;
}
