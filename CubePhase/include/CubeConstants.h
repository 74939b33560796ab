#pragma once

// Geometric tolerances. Positions are exact integers; these absorb drift in
// the accumulated orientation quaternions.
const float PLACEMENT_TOLERANCE = 0.2f;        // lattice units, local-frame vector match
const float ORIENTATION_TOLERANCE = 0.5f;      // radians between "up" stickers
const float CROSS_EDGE_DISTANCE = 1.1f;        // origin distance center -> cross edge
const float OPPOSITE_FACE_DOT = -0.9f;

const float OLL_EDGE_ADJACENT_DISTANCE = 1.8f;  // adjacent 1.41, opposite 2.0
const float CORNER_ADJACENT_DISTANCE = 2.2f;    // adjacent 2.0, diagonal 2.83
const float HEADLIGHT_NORMAL_DOT = 0.9f;
const float UNORIENTED_PAIR_DOT = 0.8f;

const float STICKER_FACING_DOT = 0.9f;   // about 25 degrees
const float SIDE_PERPENDICULAR_DOT = 0.1f;
const float SIDE_MEMBER_DOT = 0.5f;

const float QUAT_SAME_ROTATION_EPSILON = 1e-4f;

const int SCRAMBLE_LENGTH = 20;
