
#ifndef GEORANGE_SEARCH_HH
#define GEORANGE_SEARCH_HH


#include "georange.hh"
#include "geohash.hh"


NS_GEORANGE_BEGIN
NS_GEORANGE_GEO_BEGIN


class Candidate
{
    public:
        typedef std::vector<Candidate> Vector;

        Candidate();
        Candidate(const std::string& key, const Coordinate& coord);

        std::string key;
        Coordinate coord;
};


class Hit
{
    public:
        typedef std::vector<Hit> Vector;

        Hit();
        Hit(const std::string& key, double distance);

        std::string key;
        double distance;
};


struct HitCmp
{
    bool operator()(Hit const &h1, Hit const &h2) const;
};


// Refines the rows returned by scanning the query bounds: keeps
// the first row seen for each key, drops rows farther than radius
// meters from center and orders the rest nearest first.
Hit::Vector filter_candidates(const Coordinate& center, double radius,
        const Candidate::Vector& candidates);


NS_GEORANGE_GEO_END
NS_GEORANGE_END


#endif
