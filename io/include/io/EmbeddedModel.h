#pragma once

#include <string_view>

namespace io
{

inline constexpr std::string_view kEmbeddedModelName = "embedded_stock_block.stl";

// 50 x 50 x 10 mm block whose top face sits at Z0, matching the extents of the
// embedded sample program.
inline constexpr std::string_view kEmbeddedModelStl = R"(solid embedded_stock_block
  facet normal 0.0 0.0 1.0
    outer loop
      vertex 0.0 0.0 0.0
      vertex 50.0 0.0 0.0
      vertex 50.0 50.0 0.0
    endloop
  endfacet
  facet normal 0.0 0.0 1.0
    outer loop
      vertex 0.0 0.0 0.0
      vertex 50.0 50.0 0.0
      vertex 0.0 50.0 0.0
    endloop
  endfacet
  facet normal 0.0 0.0 -1.0
    outer loop
      vertex 0.0 0.0 -10.0
      vertex 0.0 50.0 -10.0
      vertex 50.0 50.0 -10.0
    endloop
  endfacet
  facet normal 0.0 0.0 -1.0
    outer loop
      vertex 0.0 0.0 -10.0
      vertex 50.0 50.0 -10.0
      vertex 50.0 0.0 -10.0
    endloop
  endfacet
  facet normal 0.0 -1.0 0.0
    outer loop
      vertex 0.0 0.0 -10.0
      vertex 50.0 0.0 -10.0
      vertex 50.0 0.0 0.0
    endloop
  endfacet
  facet normal 0.0 -1.0 0.0
    outer loop
      vertex 0.0 0.0 -10.0
      vertex 50.0 0.0 0.0
      vertex 0.0 0.0 0.0
    endloop
  endfacet
  facet normal 0.0 1.0 0.0
    outer loop
      vertex 50.0 50.0 -10.0
      vertex 0.0 50.0 -10.0
      vertex 0.0 50.0 0.0
    endloop
  endfacet
  facet normal 0.0 1.0 0.0
    outer loop
      vertex 50.0 50.0 -10.0
      vertex 0.0 50.0 0.0
      vertex 50.0 50.0 0.0
    endloop
  endfacet
  facet normal -1.0 0.0 0.0
    outer loop
      vertex 0.0 50.0 -10.0
      vertex 0.0 0.0 -10.0
      vertex 0.0 0.0 0.0
    endloop
  endfacet
  facet normal -1.0 0.0 0.0
    outer loop
      vertex 0.0 50.0 -10.0
      vertex 0.0 0.0 0.0
      vertex 0.0 50.0 0.0
    endloop
  endfacet
  facet normal 1.0 0.0 0.0
    outer loop
      vertex 50.0 0.0 -10.0
      vertex 50.0 50.0 -10.0
      vertex 50.0 50.0 0.0
    endloop
  endfacet
  facet normal 1.0 0.0 0.0
    outer loop
      vertex 50.0 0.0 -10.0
      vertex 50.0 50.0 0.0
      vertex 50.0 0.0 0.0
    endloop
  endfacet
endsolid embedded_stock_block
)";

} // namespace io
