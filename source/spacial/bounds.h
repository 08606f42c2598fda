// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <boost/geometry/geometries/box.hpp>

#include "coords.h"

namespace geoline::spacial
{

using bounds = boost::geometry::model::box<coordinates>;

/**
 * Returns the axis-aligned box spanned by two points, computed
 * component-wise over their raw latitudes and longitudes.
 *
 * This is a viewport framing hint only. It does not follow the
 * geodesic between the points, so a route crossing the antimeridian
 * will bulge outside of the box. boost::geometry::envelope is not 
 * used here because in the geographic coordinate system it wraps 
 * boxes around the antimeridian.
 */
bounds make_bounds(coordinates const& a, coordinates const& b);

/**
 * Serializes a box as [[min_lat, min_lng], [max_lat, max_lng]].
 */
json_t to_json(bounds const& box);

}
