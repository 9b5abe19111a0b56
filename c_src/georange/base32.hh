
#ifndef GEORANGE_BASE32_HH
#define GEORANGE_BASE32_HH


#include "georange.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


// Maps a 5-bit value onto the geohash alphabet. Returns '\0'
// for anything outside of 0..31.
char base32_value_to_char(int value);

// Inverse of base32_value_to_char. Returns -1 if the character
// is not part of the alphabet.
int base32_char_to_value(char c);

bool base32_is_valid(const std::string& hash);


NS_GEORANGE_GEO_END
NS_GEORANGE_END


#endif
