#include "frame_source.hpp"
#include <algorithm>
#include <cctype>

using namespace std;

namespace
{
    bool startsWith(const string &text, const string &prefix)
    {
        return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
    }

    string toLower(string text)
    {
        transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                  { return static_cast<char>(tolower(c)); });
        return text;
    }

    string trim(const string &text)
    {
        size_t begin = text.find_first_not_of(" \t\r\n");
        if (begin == string::npos)
            return "";
        size_t end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }
}

bool parseSourceDescriptor(const string &text, SourceDescriptor &descriptor)
{
    string source = trim(text);
    if (source.empty())
        return false;

    if (all_of(source.begin(), source.end(), [](unsigned char c)
               { return isdigit(c); }))
    {
        try
        {
            int index = stoi(source);
            descriptor.kind = SourceKind::DEVICE;
            descriptor.device_index = index;
            descriptor.uri.clear();
            return true;
        }
        catch (const exception &)
        {
            return false; // Out of range
        }
    }

    if (source[0] == '-')
        return false;

    string lower = toLower(source);
    static const vector<string> streamSchemes = {"rtsp://", "rtsps://", "rtmp://", "udp://", "tcp://"};
    bool isStream = any_of(streamSchemes.begin(), streamSchemes.end(), [&](const string &scheme)
                           { return startsWith(lower, scheme); });

    descriptor.kind = isStream ? SourceKind::NETWORK_STREAM : SourceKind::FILE;
    descriptor.uri = source;
    return true;
}

string SourceDescriptor::toString() const
{
    return kind == SourceKind::DEVICE ? to_string(device_index) : uri;
}

string SourceDescriptor::typeName() const
{
    switch (kind)
    {
    case SourceKind::DEVICE:
        return "USB";
    case SourceKind::NETWORK_STREAM:
        return "RTSP";
    case SourceKind::FILE:
    {
        string lower = toLower(uri);
        return (startsWith(lower, "http://") || startsWith(lower, "https://")) ? "HTTP" : "FILE";
    }
    }
    return "UNKNOWN";
}

string sourceStatusToString(SourceStatus status)
{
    switch (status)
    {
    case SourceStatus::OK:
        return "ok";
    case SourceStatus::TRANSIENT_ERROR:
        return "transient_error";
    case SourceStatus::END_OF_STREAM:
        return "end_of_stream";
    case SourceStatus::DISCONNECTED:
        return "disconnected";
    case SourceStatus::NOT_OPEN:
        return "not_open";
    }
    return "unknown";
}
