// Ticket: 0005_mesh_model

#ifndef GEO3D_MESH_MESH_ELEMENT_HPP
#define GEO3D_MESH_MESH_ELEMENT_HPP

#include <variant>

#include "geo3d-core/src/Mesh/Edge.hpp"
#include "geo3d-core/src/Mesh/Vertex.hpp"

namespace geo3d
{

/// A face-defining element whose kind is only known at runtime
using MeshElement = std::variant<Vertex, Edge>;

}  // namespace geo3d

#endif  // GEO3D_MESH_MESH_ELEMENT_HPP
