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

#ifndef GEORANGE_GEOHASH_HH
#define GEORANGE_GEOHASH_HH


#include "config.hh"
#include "georange.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


class Coordinate
{
    public:
        Coordinate();
        Coordinate(double latitude, double longitude);

        // Latitude within [-90, 90] and longitude within
        // [-180, 180], both finite.
        bool is_valid() const;

        bool operator==(const Coordinate& other) const;
        bool operator!=(const Coordinate& other) const;

        double latitude;
        double longitude;
};


// Bisects longitude and latitude alternately, longitude first,
// packing five bits per character most significant bit first.
//
// Throws GeorangeException if precision < 1 or the coordinate
// is out of range.
std::string encode(const Coordinate& coord,
        int precision = GEORANGE_DEFAULT_PRECISION);


NS_GEORANGE_GEO_END
NS_GEORANGE_END


#endif
