// Licensed under the Apache License, Version 2.0 (the "License"); you may not
// use this file except in compliance with the License. You may obtain a copy of
// the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS, WITHOUT
// WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied. See the
// License for the specific language governing permissions and limitations under
// the License.

#ifndef GEORANGE_RANGE_HH
#define GEORANGE_RANGE_HH


#include "georange.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


// One end of a query range. A bounded value is a plain geohash
// string. An unbounded value stands for its prefix followed by
// something greater than any alphabet character, i.e. it sorts
// after every hash that starts with the prefix.
class GeoHashBound
{
    public:
        static GeoHashBound bounded(const std::string& hash);
        static GeoHashBound unbounded(const std::string& prefix);

        GeoHashBound();

        const std::string& prefix() const;
        bool is_unbounded() const;

        // Wire form: the hash itself, or the prefix with a
        // trailing '~' when unbounded.
        std::string str() const;

        int compare(const GeoHashBound& other) const;

        bool operator==(const GeoHashBound& other) const;
        bool operator!=(const GeoHashBound& other) const;
        bool operator<(const GeoHashBound& other) const;
        bool operator<=(const GeoHashBound& other) const;
        bool operator>(const GeoHashBound& other) const;
        bool operator>=(const GeoHashBound& other) const;

    private:
        GeoHashBound(const std::string& prefix, bool open);

        std::string value;
        bool open;
};


// The half open interval [start, end) over geohash order.
class GeoHashRange
{
    public:
        typedef std::vector<GeoHashRange> Vector;

        GeoHashRange();
        GeoHashRange(const GeoHashBound& start, const GeoHashBound& end);

        bool is_well_formed() const;

        // start < other.start <= end < other.end
        bool is_prefix_to(const GeoHashRange& other) const;

        // start <= other.start && end >= other.end
        bool covers(const GeoHashRange& other) const;

        bool can_join(const GeoHashRange& other) const;

        // Returns false if the two ranges are not joinable.
        bool join(const GeoHashRange& other, GeoHashRange& result) const;

        bool operator==(const GeoHashRange& other) const;
        bool operator!=(const GeoHashRange& other) const;

        GeoHashBound start;
        GeoHashBound end;
};


// Builds the range of every hash that shares the first `bits`
// bits with `hash`.
GeoHashRange range_from_hash(const std::string& hash, uint32_t bits);

// Joins ranges until no pair is joinable. The result is sorted
// by start.
GeoHashRange::Vector merge(const GeoHashRange::Vector& ranges);


NS_GEORANGE_GEO_END
NS_GEORANGE_END


#endif
