
#ifndef GEORANGE_CONFIG_HH
#define GEORANGE_CONFIG_HH


// Exit codes

#define GEORANGE_OK 0
#define GEORANGE_ERROR_BAD_READ 1
#define GEORANGE_ERROR_BAD_WRITE 2
#define GEORANGE_ERROR_FATAL 255


// Port streams

#define GEORANGE_STREAM_IN 0
#define GEORANGE_STREAM_OUT 1


// Command ops

#define GEORANGE_COMMAND_CLOSE 1
#define GEORANGE_COMMAND_ENCODE 2
#define GEORANGE_COMMAND_DISTANCE 3
#define GEORANGE_COMMAND_QUERY_BOUNDS 4
#define GEORANGE_COMMAND_REGION_ENVELOPE 5
#define GEORANGE_COMMAND_FILTER_CANDIDATES 6


// Envelope output formats

#define GEORANGE_ENVELOPE_WKB 0
#define GEORANGE_ENVELOPE_WKT 1


// Geohash

#define GEORANGE_BASE32_ALPHABET "0123456789bcdefghjkmnpqrstuvwxyz"
#define GEORANGE_BITS_PER_CHAR 5
#define GEORANGE_DEFAULT_PRECISION 10
#define GEORANGE_MAX_PRECISION 22
#define GEORANGE_MAX_BITS (GEORANGE_MAX_PRECISION * GEORANGE_BITS_PER_CHAR)

// Sorts after every character of the alphabet
#define GEORANGE_RANGE_SENTINEL '~'


// Earth shape

#define GEORANGE_METERS_PER_DEGREE_LATITUDE 110574.0

// Equatorial radius in meters
#define GEORANGE_EARTH_EQ_RADIUS 6378137.0

// (r_e^2 - r_p^2) / r_e^2 with r_p = 6356752.3
#define GEORANGE_EARTH_E2 0.00669447819799

#define GEORANGE_EPSILON 1e-12


#endif
