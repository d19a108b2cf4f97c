#pragma once
#include <stdexcept>
#include <string>
#include <vector>

// Check if a flag exists in command line args
inline bool hasFlag(int argc, char **argv, const std::string &flag)
{
    for (int i = 1; i < argc; i++)
    {
        if (std::string(argv[i]) == flag)
        {
            return true;
        }
    }
    return false;
}

// Check if a flag that expects a value was given with one
inline bool hasArg(int argc, char **argv, const std::string &flag)
{
    for (int i = 1; i < argc; i++)
    {
        if (std::string(argv[i]) == flag && i + 1 < argc)
        {
            return true;
        }
    }
    return false;
}

// Get a string argument from command line
inline std::string getArg(int argc, char **argv, const std::string &flag, const std::string &defaultValue)
{
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == flag && i + 1 < argc)
        {
            return argv[i + 1];
        }
    }
    return defaultValue;
}

// Parse a whole string as an integer, false on trailing garbage or overflow
inline bool parseInt(const std::string &text, int &value)
{
    if (text.empty())
        return false;
    try
    {
        size_t used = 0;
        int parsed = std::stoi(text, &used);
        if (used != text.size())
            return false;
        value = parsed;
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

// Parse a whole string as a floating point number
inline bool parseDouble(const std::string &text, double &value)
{
    if (text.empty())
        return false;
    try
    {
        size_t used = 0;
        double parsed = std::stod(text, &used);
        if (used != text.size())
            return false;
        value = parsed;
        return true;
    }
    catch (const std::exception &)
    {
        return false;
    }
}

// Split a comma-separated string into a vector of strings
inline std::vector<std::string> splitString(const std::string &str, char delimiter = ',')
{
    std::vector<std::string> result;
    size_t start = 0;
    size_t end = str.find(delimiter);

    while (end != std::string::npos)
    {
        result.push_back(str.substr(start, end - start));
        start = end + 1;
        end = str.find(delimiter, start);
    }

    result.push_back(str.substr(start));
    return result;
}

