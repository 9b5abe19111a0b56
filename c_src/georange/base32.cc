
#include "base32.hh"
#include "config.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


static const char alphabet[] = GEORANGE_BASE32_ALPHABET;


char
base32_value_to_char(int value)
{
    if(value < 0 || value > 31) {
        return '\0';
    }

    return alphabet[value];
}


int
base32_char_to_value(char c)
{
    for(int i = 0; i < 32; i++) {
        if(alphabet[i] == c) {
            return i;
        }
    }

    return -1;
}


bool
base32_is_valid(const std::string& hash)
{
    for(size_t i = 0; i < hash.size(); i++) {
        if(base32_char_to_value(hash[i]) < 0) {
            return false;
        }
    }

    return true;
}


NS_GEORANGE_GEO_END
NS_GEORANGE_END
