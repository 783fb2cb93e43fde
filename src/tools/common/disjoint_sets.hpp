#pragma once
#include <vector>
#include <cstddef>
#include "verify.hpp"

// Union-find over dense integer handles handed out by add(). Handles never depend on the
// stored objects, so two equal-looking records stay distinct until linked explicitly.
class DisjointSet {
private:
    std::vector<size_t> parent;
    bool cnt = false;
public:
    DisjointSet() = default;
    explicit DisjointSet(size_t size) : parent(size) {
        for(size_t i = 0; i < size; i++)
            parent[i] = i;
    }

    size_t add() {
        parent.push_back(parent.size());
        return parent.size() - 1;
    }

    size_t size() const {return parent.size();}

    size_t get(size_t obj) {
        VERIFY(obj < parent.size());
        size_t root = obj;
        while(parent[root] != root)
            root = parent[root];
        while(parent[obj] != root) {
            size_t next = parent[obj];
            parent[obj] = root;
            obj = next;
        }
        return root;
    }

    void link(size_t obj1, size_t obj2) {
        obj1 = get(obj1);
        obj2 = get(obj2);
        if(obj1 == obj2)
            return;
        if(cnt) {
            parent[obj1] = obj2;
        } else {
            parent[obj2] = obj1;
        }
        cnt = !cnt;
    }

    // Components in order of their smallest handle, members ascending.
    std::vector<std::vector<size_t>> subsets() {
        std::vector<std::vector<size_t>> res;
        std::vector<size_t> component(parent.size(), size_t(-1));
        for(size_t obj = 0; obj < parent.size(); obj++) {
            size_t root = get(obj);
            if(component[root] == size_t(-1)) {
                component[root] = res.size();
                res.emplace_back();
            }
            res[component[root]].push_back(obj);
        }
        return res;
    }
};
