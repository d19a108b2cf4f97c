#include "websocket_protocol.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>

using namespace std;

namespace websocket
{
    namespace
    {
        const char *HANDSHAKE_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

        class Sha1
        {
        public:
            Sha1()
            {
                h_[0] = 0x67452301;
                h_[1] = 0xEFCDAB89;
                h_[2] = 0x98BADCFE;
                h_[3] = 0x10325476;
                h_[4] = 0xC3D2E1F0;
            }

            void update(const uint8_t *data, size_t size)
            {
                for (size_t i = 0; i < size; i++)
                {
                    buffer_[buffer_pos_++] = data[i];
                    length_++;

                    if (buffer_pos_ == 64)
                    {
                        processBlock();
                        buffer_pos_ = 0;
                    }
                }
            }

            vector<uint8_t> finalize()
            {
                buffer_[buffer_pos_++] = 0x80;

                if (buffer_pos_ > 56)
                {
                    while (buffer_pos_ < 64)
                        buffer_[buffer_pos_++] = 0;
                    processBlock();
                    buffer_pos_ = 0;
                }

                while (buffer_pos_ < 56)
                    buffer_[buffer_pos_++] = 0;

                // Message length in bits, big endian
                uint64_t bit_length = length_ * 8;
                for (int i = 7; i >= 0; i--)
                {
                    buffer_[56 + i] = bit_length & 0xFF;
                    bit_length >>= 8;
                }
                processBlock();

                vector<uint8_t> digest(20);
                for (int i = 0; i < 5; i++)
                {
                    digest[i * 4] = (h_[i] >> 24) & 0xFF;
                    digest[i * 4 + 1] = (h_[i] >> 16) & 0xFF;
                    digest[i * 4 + 2] = (h_[i] >> 8) & 0xFF;
                    digest[i * 4 + 3] = h_[i] & 0xFF;
                }
                return digest;
            }

        private:
            static uint32_t leftRotate(uint32_t value, int amount)
            {
                return (value << amount) | (value >> (32 - amount));
            }

            void processBlock()
            {
                uint32_t w[80];
                for (int i = 0; i < 16; i++)
                {
                    w[i] = (uint32_t(buffer_[i * 4]) << 24) | (uint32_t(buffer_[i * 4 + 1]) << 16) |
                           (uint32_t(buffer_[i * 4 + 2]) << 8) | uint32_t(buffer_[i * 4 + 3]);
                }
                for (int i = 16; i < 80; i++)
                    w[i] = leftRotate(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);

                uint32_t a = h_[0], b = h_[1], c = h_[2], d = h_[3], e = h_[4];

                for (int i = 0; i < 80; i++)
                {
                    uint32_t f, k;
                    if (i < 20)
                    {
                        f = (b & c) | ((~b) & d);
                        k = 0x5A827999;
                    }
                    else if (i < 40)
                    {
                        f = b ^ c ^ d;
                        k = 0x6ED9EBA1;
                    }
                    else if (i < 60)
                    {
                        f = (b & c) | (b & d) | (c & d);
                        k = 0x8F1BBCDC;
                    }
                    else
                    {
                        f = b ^ c ^ d;
                        k = 0xCA62C1D6;
                    }

                    uint32_t temp = leftRotate(a, 5) + f + e + k + w[i];
                    e = d;
                    d = c;
                    c = leftRotate(b, 30);
                    b = a;
                    a = temp;
                }

                h_[0] += a;
                h_[1] += b;
                h_[2] += c;
                h_[3] += d;
                h_[4] += e;
            }

            uint32_t h_[5];
            uint64_t length_ = 0;
            uint8_t buffer_[64] = {};
            uint8_t buffer_pos_ = 0;
        };

        // Opcode byte plus the 7 / 7+16 / 7+64 bit payload length, no mask
        vector<uint8_t> frameHeader(uint8_t opcode, size_t payload_length)
        {
            vector<uint8_t> header;
            header.push_back(0x80 | opcode); // FIN

            if (payload_length < 126)
            {
                header.push_back(static_cast<uint8_t>(payload_length));
            }
            else if (payload_length < 65536)
            {
                header.push_back(126);
                header.push_back((payload_length >> 8) & 0xFF);
                header.push_back(payload_length & 0xFF);
            }
            else
            {
                header.push_back(127);
                for (int i = 7; i >= 0; i--)
                    header.push_back((static_cast<uint64_t>(payload_length) >> (i * 8)) & 0xFF);
            }
            return header;
        }

        string toLower(string text)
        {
            transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                      { return static_cast<char>(tolower(c)); });
            return text;
        }
    }

    vector<uint8_t> sha1(const string &data)
    {
        Sha1 hasher;
        hasher.update(reinterpret_cast<const uint8_t *>(data.data()), data.size());
        return hasher.finalize();
    }

    string acceptKey(const string &client_key)
    {
        return encoding::base64Encode(sha1(client_key + HANDSHAKE_GUID));
    }

    vector<uint8_t> textFrame(const string &payload)
    {
        vector<uint8_t> frame = frameHeader(0x1, payload.size());
        frame.insert(frame.end(), payload.begin(), payload.end());
        return frame;
    }

    vector<uint8_t> pingFrame()
    {
        return frameHeader(0x9, 0);
    }

    vector<uint8_t> closeFrame(uint16_t status_code)
    {
        vector<uint8_t> frame = frameHeader(0x8, 2);
        frame.push_back((status_code >> 8) & 0xFF);
        frame.push_back(status_code & 0xFF);
        return frame;
    }

    bool isUpgradeRequest(const string &upgrade_header, const string &connection_header)
    {
        return toLower(upgrade_header) == "websocket" &&
               toLower(connection_header).find("upgrade") != string::npos;
    }

} // namespace websocket
