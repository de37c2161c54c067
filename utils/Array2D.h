/*=====================================================================
Array2D.h
---------
Copyright Glare Technologies Limited 2026 -
=====================================================================*/
#pragma once


#include <vector>
#include <assert.h>
#include <stddef.h>


/*=====================================================================
Array2D
-------
Row-major 2D array.  dim1 is the width (x), dim2 is the height (y),
so elem(x, y) is stored at index y * dim1 + x, matching raster image
layout.
=====================================================================*/
template <class Field>
class Array2D
{
public:
	inline Array2D();
	inline Array2D(size_t dim1, size_t dim2);
	inline Array2D(size_t dim1, size_t dim2, const Field& initial_val);

	inline Field& elem(size_t x, size_t y);
	inline const Field& elem(size_t x, size_t y) const;

	bool operator == (const Array2D& rhs) const;
	bool operator != (const Array2D& rhs) const { return !(*this == rhs); }

	inline void setAllElems(const Field& newval);

	void resize(size_t newdim1, size_t newdim2); // Resize, copying any existing data to new data array.
	void resizeNoCopy(size_t newdim1, size_t newdim2); // Resize without preserving the layout of exising data.

	inline size_t getWidth()  const { return dim1; }
	inline size_t getHeight() const { return dim2; }
	inline size_t numElements() const { return data.size(); }

	inline const Field* getData() const { return data.data(); }
	inline Field* getData() { return data.data(); }

	inline Field* rowBegin(size_t y);
	inline const Field* rowBegin(size_t y) const;

private:
	std::vector<Field> data;
	size_t dim1;
	size_t dim2;
};


template <class Field>
Array2D<Field>::Array2D()
:	dim1(0),
	dim2(0)
{
}


template <class Field>
Array2D<Field>::Array2D(size_t dim1_, size_t dim2_)
:	data(dim1_ * dim2_),
	dim1(dim1_),
	dim2(dim2_)
{
}


template <class Field>
Array2D<Field>::Array2D(size_t dim1_, size_t dim2_, const Field& initial_val)
:	data(dim1_ * dim2_, initial_val),
	dim1(dim1_),
	dim2(dim2_)
{
}


template <class Field>
Field& Array2D<Field>::elem(size_t x, size_t y)
{
	assert(x < dim1 && y < dim2);
	return data[y * dim1 + x];
}


template <class Field>
const Field& Array2D<Field>::elem(size_t x, size_t y) const
{
	assert(x < dim1 && y < dim2);
	return data[y * dim1 + x];
}


template <class Field>
bool Array2D<Field>::operator == (const Array2D<Field>& rhs) const
{
	return dim1 == rhs.dim1 && dim2 == rhs.dim2 && data == rhs.data;
}


template <class Field>
void Array2D<Field>::setAllElems(const Field& newval)
{
	for(size_t i = 0; i < data.size(); ++i)
		data[i] = newval;
}


template <class Field>
void Array2D<Field>::resize(size_t newdim1, size_t newdim2)
{
	std::vector<Field> newdata(newdim1 * newdim2);

	const size_t minx = newdim1 < dim1 ? newdim1 : dim1;
	const size_t miny = newdim2 < dim2 ? newdim2 : dim2;

	for(size_t y = 0; y < miny; y++)
		for(size_t x = 0; x < minx; x++)
			newdata[x + y * newdim1] = data[x + y * dim1];

	data.swap(newdata);
	dim1 = newdim1;
	dim2 = newdim2;
}


template <class Field>
void Array2D<Field>::resizeNoCopy(size_t newdim1, size_t newdim2)
{
	data.resize(newdim1 * newdim2);
	dim1 = newdim1;
	dim2 = newdim2;
}


template <class Field>
Field* Array2D<Field>::rowBegin(size_t y)
{
	assert(y < dim2);
	return &data[y * dim1];
}


template <class Field>
const Field* Array2D<Field>::rowBegin(size_t y) const
{
	assert(y < dim2);
	return &data[y * dim1];
}
