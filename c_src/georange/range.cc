
#include <algorithm>

#include "base32.hh"
#include "config.hh"
#include "exceptions.hh"
#include "range.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


GeoHashBound
GeoHashBound::bounded(const std::string& hash)
{
    return GeoHashBound(hash, false);
}


GeoHashBound
GeoHashBound::unbounded(const std::string& prefix)
{
    return GeoHashBound(prefix, true);
}


GeoHashBound::GeoHashBound()
{
    this->open = false;
}


GeoHashBound::GeoHashBound(const std::string& prefix, bool open)
{
    this->value = prefix;
    this->open = open;
}


const std::string&
GeoHashBound::prefix() const
{
    return this->value;
}


bool
GeoHashBound::is_unbounded() const
{
    return this->open;
}


std::string
GeoHashBound::str() const
{
    if(this->open) {
        return this->value + GEORANGE_RANGE_SENTINEL;
    }

    return this->value;
}


int
GeoHashBound::compare(const GeoHashBound& other) const
{
    const std::string& a = this->value;
    const std::string& b = other.value;
    size_t n = std::min(a.size(), b.size());

    int c = a.compare(0, n, b, 0, n);
    if(c != 0) {
        return c < 0 ? -1 : 1;
    }

    if(a.size() == b.size()) {
        return (this->open ? 1 : 0) - (other.open ? 1 : 0);
    }

    // One side is a proper prefix of the other. The open end
    // sorts above any continuation, a closed one below it.
    if(a.size() < b.size()) {
        return this->open ? 1 : -1;
    }

    return other.open ? -1 : 1;
}


bool
GeoHashBound::operator==(const GeoHashBound& other) const
{
    return this->compare(other) == 0;
}


bool
GeoHashBound::operator!=(const GeoHashBound& other) const
{
    return this->compare(other) != 0;
}


bool
GeoHashBound::operator<(const GeoHashBound& other) const
{
    return this->compare(other) < 0;
}


bool
GeoHashBound::operator<=(const GeoHashBound& other) const
{
    return this->compare(other) <= 0;
}


bool
GeoHashBound::operator>(const GeoHashBound& other) const
{
    return this->compare(other) > 0;
}


bool
GeoHashBound::operator>=(const GeoHashBound& other) const
{
    return this->compare(other) >= 0;
}


GeoHashRange::GeoHashRange()
{
}


GeoHashRange::GeoHashRange(const GeoHashBound& start, const GeoHashBound& end)
{
    this->start = start;
    this->end = end;
}


bool
GeoHashRange::is_well_formed() const
{
    return !this->start.is_unbounded() && this->start < this->end;
}


bool
GeoHashRange::is_prefix_to(const GeoHashRange& other) const
{
    return this->end >= other.start
            && this->start < other.start
            && this->end < other.end;
}


bool
GeoHashRange::covers(const GeoHashRange& other) const
{
    return this->start <= other.start && this->end >= other.end;
}


bool
GeoHashRange::can_join(const GeoHashRange& other) const
{
    return this->is_prefix_to(other)
            || other.is_prefix_to(*this)
            || this->covers(other)
            || other.covers(*this);
}


bool
GeoHashRange::join(const GeoHashRange& other, GeoHashRange& result) const
{
    if(this->is_prefix_to(other)) {
        result = GeoHashRange(this->start, other.end);
    } else if(other.is_prefix_to(*this)) {
        result = GeoHashRange(other.start, this->end);
    } else if(this->covers(other)) {
        result = *this;
    } else if(other.covers(*this)) {
        result = other;
    } else {
        return false;
    }

    return true;
}


bool
GeoHashRange::operator==(const GeoHashRange& other) const
{
    return this->start == other.start && this->end == other.end;
}


bool
GeoHashRange::operator!=(const GeoHashRange& other) const
{
    return !(*this == other);
}


GeoHashRange
range_from_hash(const std::string& hash, uint32_t bits)
{
    // Zero bits of precision can't tell any two hashes apart.
    if(bits == 0) {
        return GeoHashRange(
                GeoHashBound::bounded(""),
                GeoHashBound::unbounded("")
            );
    }

    size_t precision = ((bits - 1) / GEORANGE_BITS_PER_CHAR) + 1;

    if(hash.size() < precision) {
        return GeoHashRange(
                GeoHashBound::bounded(hash),
                GeoHashBound::unbounded(hash)
            );
    }

    std::string truncated = hash.substr(0, precision);
    if(!base32_is_valid(truncated)) {
        throw InvariantViolation("non-geohash input to range: " + truncated);
    }

    std::string base = truncated.substr(0, precision - 1);
    int last_value = base32_char_to_value(truncated[precision - 1]);

    uint32_t significant = bits - base.size() * GEORANGE_BITS_PER_CHAR;
    uint32_t unused = GEORANGE_BITS_PER_CHAR - significant;

    int start_value = (last_value >> unused) << unused;
    int end_value = start_value + (1 << unused);

    GeoHashBound start = GeoHashBound::bounded(
            base + base32_value_to_char(start_value));

    GeoHashBound end;
    if(end_value > 31) {
        end = GeoHashBound::unbounded(base);
    } else {
        end = GeoHashBound::bounded(base + base32_value_to_char(end_value));
    }

    return GeoHashRange(start, end);
}


static bool
range_cmp(const GeoHashRange& a, const GeoHashRange& b)
{
    int c = a.start.compare(b.start);
    if(c != 0) {
        return c < 0;
    }

    return a.end < b.end;
}


// Replaces the first joinable pair with its join. Returns false
// once no pair can be joined.
static bool
join_once(GeoHashRange::Vector& ranges)
{
    GeoHashRange joined;

    for(size_t i = 0; i < ranges.size(); i++) {
        for(size_t j = i + 1; j < ranges.size(); j++) {
            if(!ranges[i].join(ranges[j], joined)) {
                continue;
            }

            ranges.erase(ranges.begin() + j);
            ranges.erase(ranges.begin() + i);
            ranges.push_back(joined);
            return true;
        }
    }

    return false;
}


GeoHashRange::Vector
merge(const GeoHashRange::Vector& ranges)
{
    GeoHashRange::Vector ret(ranges);

    // Every successful join shrinks the set by one so this
    // runs at most ranges.size() - 1 times.
    while(ret.size() > 1 && join_once(ret)) {
    }

    std::sort(ret.begin(), ret.end(), range_cmp);

    return ret;
}


NS_GEORANGE_GEO_END
NS_GEORANGE_END
