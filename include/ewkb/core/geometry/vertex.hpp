#pragma once

#include "ewkb/common.hpp"

namespace ewkb {

namespace core {

template <class T>
struct PointXY {
	using VALUE_TYPE = T;
	static constexpr idx_t SIZE = 2;

public:
	T x;
	T y;

public:
	PointXY() = default;
	PointXY(const T &x_p, const T &y_p) : x(x_p), y(y_p) {
	}
	explicit PointXY(const T &val_p) : x(val_p), y(val_p) {
	}

	T &operator[](const idx_t i) {
		D_ASSERT(i < 2);
		return i == 0 ? x : y;
	}
	T operator[](const idx_t i) const {
		D_ASSERT(i < 2);
		return i == 0 ? x : y;
	}

	bool operator==(const PointXY &other) const {
		return x == other.x && y == other.y;
	}

	bool operator!=(const PointXY &other) const {
		return x != other.x || y != other.y;
	}
};

template <class T>
struct PointXYZ : PointXY<T> {
public:
	using VALUE_TYPE = T;
	static constexpr idx_t SIZE = 3;

public:
	using PointXY<T>::x;
	using PointXY<T>::y;
	T z;

public:
	PointXYZ() = default;
	PointXYZ(const T &x_p, const T &y_p, const T &z_p) : PointXY<T>(x_p, y_p), z(z_p) {
	}
	explicit PointXYZ(const T &val_p) : PointXY<T>(val_p), z(val_p) {
	}

	T &operator[](const idx_t i) {
		D_ASSERT(i < 3);
		return i == 0 ? x : i == 1 ? y : z;
	}

	T operator[](const idx_t i) const {
		D_ASSERT(i < 3);
		return i == 0 ? x : i == 1 ? y : z;
	}

	bool operator==(const PointXYZ &other) const {
		return x == other.x && y == other.y && z == other.z;
	}

	bool operator!=(const PointXYZ &other) const {
		return !(*this == other);
	}
};

// The two coordinate shapes of the codec. M ordinates are carried in the Z slot.
enum class VertexType : uint8_t { XY, XYZ };

struct VertexXY : public PointXY<double> {
	static const constexpr VertexType TYPE = VertexType::XY;
	static const constexpr bool HAS_Z = false;

	VertexXY() = default;
	explicit VertexXY(double val) : PointXY<double>(val) {
	}
	VertexXY(double x, double y) : PointXY<double>(x, y) {
	}
};

struct VertexXYZ : public PointXYZ<double> {
	static const constexpr VertexType TYPE = VertexType::XYZ;
	static const constexpr bool HAS_Z = true;

	VertexXYZ() = default;
	explicit VertexXYZ(double val) : PointXYZ<double>(val) {
	}
	VertexXYZ(double x, double y, double z) : PointXYZ<double>(x, y, z) {
	}
};

} // namespace core

} // namespace ewkb
