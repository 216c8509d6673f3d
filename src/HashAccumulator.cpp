#include "HashAccumulator.hpp"
#include "CatalogErrors.hpp"

#include <blake3.h>
#include <openssl/evp.h>

namespace
{
    class Blake3Accumulator : public HashAccumulator
    {
    public:
        Blake3Accumulator()
        {
            blake3_hasher_init(&Hasher);
        }

        void Update(const uint8_t* Data, size_t Length) override
        {
            blake3_hasher_update(&Hasher, Data, Length);
        }

        std::string FinalizeHex() override
        {
            uint8_t OutHash[BLAKE3_OUT_LEN] = { 0 };
            blake3_hasher_finalize(&Hasher, OutHash, sizeof(OutHash));
            return ToHex(OutHash, sizeof(OutHash));
        }

    private:
        blake3_hasher Hasher;
    };

    struct EvpMdCtxDeleter
    {
        void operator()(EVP_MD_CTX* Ctx) const { EVP_MD_CTX_free(Ctx); }
    };

    class EvpAccumulator : public HashAccumulator
    {
    public:
        explicit EvpAccumulator(const EVP_MD* Digest) : Ctx(EVP_MD_CTX_new())
        {
            if (!Ctx)
            {
                throw CatalogError("EVP_MD_CTX_new failed");
            }
            if (EVP_DigestInit_ex(Ctx.get(), Digest, nullptr) != 1)
            {
                throw CatalogError("EVP_DigestInit_ex failed");
            }
        }

        void Update(const uint8_t* Data, size_t Length) override
        {
            if (EVP_DigestUpdate(Ctx.get(), Data, Length) != 1)
            {
                throw CatalogError("EVP_DigestUpdate failed");
            }
        }

        std::string FinalizeHex() override
        {
            unsigned char Out[EVP_MAX_MD_SIZE];
            unsigned int OutLen = 0;
            if (EVP_DigestFinal_ex(Ctx.get(), Out, &OutLen) != 1)
            {
                throw CatalogError("EVP_DigestFinal_ex failed");
            }
            return ToHex(Out, OutLen);
        }

    private:
        std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> Ctx;
    };
}

std::unique_ptr<HashAccumulator> HashAccumulator::Create(HashAlgorithm Algorithm)
{
    switch (Algorithm)
    {
    case HashAlgorithm::Blake3: return std::make_unique<Blake3Accumulator>();
    case HashAlgorithm::Sha1:   return std::make_unique<EvpAccumulator>(EVP_sha1());
    case HashAlgorithm::Sha256: return std::make_unique<EvpAccumulator>(EVP_sha256());
    }
    throw CatalogError("Unsupported hash algorithm");
}

std::string ToHex(const uint8_t* Data, size_t Length)
{
    static const char Digits[] = "0123456789abcdef";
    std::string Hex;
    Hex.reserve(Length * 2);
    for (size_t i = 0; i < Length; ++i)
    {
        Hex += Digits[Data[i] >> 4];
        Hex += Digits[Data[i] & 0x0F];
    }
    return Hex;
}
