#ifndef STRINGUTILS_HPP
#define STRINGUTILS_HPP

#include <string>
#include <vector>

namespace GossamerUtils {
    /**
     * @brief Whitespace eltávolítása a sorok végéről és elejéről (config tisztítás).
     */
    std::string trim(const std::string& s);

    /**
     * @brief Szétvágás elválasztó mentén; az üres darabokat eldobja, a többit trimeli.
     */
    std::vector<std::string> split(const std::string& s, char delimiter);

    /**
     * @brief Nem-negatív egész parse-olása, teljes egyezéssel.
     * @throws std::runtime_error ha nem szám, vagy max fölötti.
     */
    unsigned long long parseUnsigned(const std::string& s, unsigned long long max, const std::string& what);

    std::string toLower(std::string s);
}

#endif
