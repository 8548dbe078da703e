#ifndef IHASHCALCULATOR_HPP
#define IHASHCALCULATOR_HPP

#include <string>

class IHashCalculator {
public:
    // Hex digest of the file content, empty string if the file cannot be read
    virtual std::string calculateHash(const std::string& filePath) const = 0;
    virtual std::string calculateHashOfString(const std::string& data) const = 0;
    virtual ~IHashCalculator() = default;
};

#endif // IHASHCALCULATOR_HPP
