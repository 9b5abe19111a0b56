
#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_set>

#include "exceptions.hh"
#include "geodesy.hh"
#include "search.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


Candidate::Candidate()
{
}


Candidate::Candidate(const std::string& key, const Coordinate& coord)
{
    this->key = key;
    this->coord = coord;
}


Hit::Hit()
{
    this->distance = 0.0;
}


Hit::Hit(const std::string& key, double distance)
{
    this->key = key;
    this->distance = distance;
}


bool
HitCmp::operator()(Hit const &h1, Hit const &h2) const
{
    return h1.distance < h2.distance;
}


Hit::Vector
filter_candidates(const Coordinate& center, double radius,
        const Candidate::Vector& candidates)
{
    if(!std::isfinite(radius) || radius < 0.0) {
        std::stringstream ss;
        ss << "Invalid search radius: " << radius;
        throw GeorangeException(ss.str());
    }

    std::unordered_set<std::string> seen;
    Hit::Vector hits;

    for(size_t i = 0; i < candidates.size(); i++) {
        const Candidate& c = candidates[i];

        if(!seen.insert(c.key).second) {
            continue;
        }

        double d = distance(center, c.coord);
        if(d <= radius) {
            hits.push_back(Hit(c.key, d));
        }
    }

    std::stable_sort(hits.begin(), hits.end(), HitCmp());

    return hits;
}


NS_GEORANGE_GEO_END
NS_GEORANGE_END
