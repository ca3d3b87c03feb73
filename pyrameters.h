/*  This file is part of PKDGRAV3 (http://www.pkdgrav.org/).
 *  Copyright (c) 2001-2018 Joachim Stadel & Douglas Potter
 *
 *  PKDGRAV3 is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  PKDGRAV3 is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with PKDGRAV3.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef PYRAMETERS_H
#define PYRAMETERS_H
#include <Python.h>
#include <stdexcept>
#include <string>
#include <cstdint>
#include "blitz/array.h"

// Parameters held as attributes of a Python namespace. "arguments_" has
// the current values and "specified_" records which of them were set by a
// parameter file. Needs a running interpreter.
class pyrameters {
    template<typename>
    struct is_blitz_tinyvector : std::false_type {};

    template<typename U, int N>
    struct is_blitz_tinyvector<blitz::TinyVector<U, N>> : std::true_type {};

    static std::domain_error bad_value(const char *name) {
        return std::domain_error(std::string("parameter ") + name + " has an invalid value");
    }

protected:
    PyObject *arguments_=nullptr, *specified_=nullptr;

    // Look up a parameter and convert it; a callable is called first
    template<typename T>
    T get(const char *name) const {
        auto obj = get<PyObject *>(name);
        T result;
        try {
            result = get<T>(name, obj);
        }
        catch (...) {
            Py_DECREF(obj);
            throw;
        }
        Py_DECREF(obj);
        return result;
    }

    template<typename T>
    T get(const char *name, PyObject *v) const {
        if constexpr (is_blitz_tinyvector<T>::value) {
            // A scalar is broadcast to every component
            if (!PyList_Check(v)) return T(get<typename T::T_numtype>(name,v));
            T result;
            if (PyList_Size(v) != result.length()) throw bad_value(name);
            for (int i = 0; i < result.length(); ++i)
                result[i] = get<typename T::T_numtype>(name, PyList_GetItem(v, i));
            return result;
        }
        else if constexpr (std::is_same<T, bool>::value) {
            return PyObject_IsTrue(v)>0;
        }
        else if constexpr (std::is_integral<T>::value) {
            if (PyLong_Check(v) && !PyBool_Check(v)) return PyLong_AsLongLong(v);
        }
        else if constexpr (std::is_floating_point<T>::value) {
            if (PyFloat_Check(v)) return PyFloat_AsDouble(v);
            if (PyLong_Check(v) && !PyBool_Check(v)) return PyLong_AsLongLong(v);
        }
        else {
            static_assert(std::is_same_v<T, void>, "Unsupported type for get");
        }
        throw bad_value(name);
    }

    template<typename T>
    static PyObject *to_python(const T &value) {
        if constexpr (std::is_same<T, bool>::value) {
            return Py_NewRef(value ? Py_True : Py_False);
        }
        else if constexpr (std::is_integral<T>::value) {
            return PyLong_FromLongLong(value);
        }
        else if constexpr (std::is_floating_point<T>::value) {
            return PyFloat_FromDouble(value);
        }
        else if constexpr (std::is_same<T, const char *>::value) {
            return PyUnicode_FromString(value);
        }
        else if constexpr (is_blitz_tinyvector<T>::value) {
            auto list = PyList_New(value.length());
            for (int i = 0; i < value.length(); ++i) PyList_SetItem(list,i,to_python(value[i]));
            return list;
        }
        else {
            static_assert(std::is_same_v<T, void>, "Unsupported type for set");
        }
    }

public:
    pyrameters() = default;
    pyrameters(const pyrameters &) = delete;
    pyrameters &operator=(const pyrameters &) = delete;
    virtual ~pyrameters() {
        if (Py_IsInitialized()) {
            Py_XDECREF(arguments_);
            Py_XDECREF(specified_);
        }
    }

    // Override a value from code; does not mark it as specified
    template<typename T>
    void set(const char *name, const T &value) {
        auto obj = to_python(value);
        PyObject_SetAttrString(arguments_,name,obj);
        Py_DECREF(obj);
    }

    /// @brief Take every known name from a dictionary
    /// @param kwobj dictionary of names to values
    /// @return false, with nothing changed, if any name is not a parameter
    bool update(PyObject *kwobj);

    /// @brief Run a Python parameter file and take its module level names
    /// @param filename script to run
    /// @return true if every name in the script is a known parameter
    bool load(const char *filename);

    /// @brief Was this parameter given in the parameter file
    bool has(const char *name) const;
};

template<> PyObject *pyrameters::get<PyObject *>(const char *name) const;

#endif
