/* Copyright 2023 Adam Green (https://github.com/adamgreen/)

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/
// Narrow query interface onto the hierarchical configuration which describes the target system, along with a
// simple fixed capacity implementation of it.
//
// Path patterns are made up of '/' separated segments:
//  * Each segment is matched against one level of node names using shell wildcards (*, ?, [...]).
//  * A segment of "**" matches zero or more levels.
// For example "**/pulp_chip/*" matches every direct child of any node named pulp_chip, wherever it sits.
#ifndef CONFIG_TREE_H_
#define CONFIG_TREE_H_

#include <stdint.h>
#include <stddef.h>
#include <stdio.h>
#include "config.h"


// Opaque handle to a node within a ConfigTree. NULL refers to the root of the tree.
typedef const void* ConfigNode;


class ConfigTree
{
    public:
        virtual ~ConfigTree() {}

        // Derived classes must implement these virtual methods.

        // Find the nodes below parent (NULL for the root) whose relative path matches pPattern.
        //
        // pNodes - Array to be filled in with the matching nodes, in a stable order.
        // maxNodes - Number of elements in pNodes.
        //
        // Returns the total number of matching nodes, which can be larger than maxNodes. Only the first maxNodes
        // matches are placed in pNodes.
        virtual size_t findNodes(ConfigNode parent, const char* pPattern, ConfigNode* pNodes, size_t maxNodes) const = 0;

        // Read the named scalar field of a node as a string.
        //
        // Returns true if the field exists and its \0 terminated value fits in valueSize bytes.
        // Returns false otherwise.
        virtual bool readField(ConfigNode node, const char* pFieldName, char* pValue, size_t valueSize) const = 0;


        // Result of the typed field helpers below.
        enum FieldStatus
        {
            FIELD_FOUND,
            FIELD_MISSING,
            FIELD_INVALID
        };

        // Read a field holding an unsigned 32-bit number in decimal or 0x prefixed hexadecimal.
        FieldStatus readU32Field(ConfigNode node, const char* pFieldName, uint32_t* pValue) const;

        // Read a field holding true/false (1/0, yes/no are accepted too).
        FieldStatus readBoolField(ConfigNode node, const char* pFieldName, bool* pValue) const;
};


// ConfigTree which holds all of its nodes and fields in fixed size arrays (see MAX_CONFIG_* in config.h).
// It can be populated programmatically, from text or from a file where each line looks like:
//   path/to/node.field = value
//   path/to/node
// Blank lines are ignored and '#' starts a comment which runs to the end of the line.
class MemoryConfigTree : public ConfigTree
{
    public:
        MemoryConfigTree();

        // Discard all nodes and fields.
        void clear();

        // Create the node at pPath, along with any missing parents.
        //
        // Returns the node on success or NULL if the path is malformed or the tree is full.
        ConfigNode addNode(const char* pPath);

        // Set (or overwrite) a field on the node at pPath, creating the node if needed.
        //
        // Returns true on success or false if the path/name/value is malformed, too long or the tree is full.
        bool setField(const char* pPath, const char* pFieldName, const char* pValue);

        // Add the nodes and fields described by pText in the line format documented above.
        //
        // Returns true if every line was accepted and false on the first malformed line.
        bool parse(const char* pText);

        // Read pFilename and parse() its contents.
        bool loadFile(const char* pFilename);

        size_t getNodeCount() const
        {
            return m_nodeCount;
        }

        virtual size_t findNodes(ConfigNode parent, const char* pPattern, ConfigNode* pNodes, size_t maxNodes) const;
        virtual bool readField(ConfigNode node, const char* pFieldName, char* pValue, size_t valueSize) const;

    protected:
        struct Node
        {
            char name[MAX_CONFIG_NAME_LENGTH + 1];
            int  parent;
        };
        struct Field
        {
            int  node;
            char name[MAX_CONFIG_NAME_LENGTH + 1];
            char value[MAX_CONFIG_VALUE_LENGTH + 1];
        };

        static const int ROOT_NODE = 0;

        int findChild(int parent, const char* pName, size_t nameLength) const;
        int addChild(int parent, const char* pName, size_t nameLength);
        int nodeIndex(ConfigNode node) const;
        bool isDescendant(int node, int ancestor) const;
        size_t buildRelativePath(int node, int ancestor, const char** ppSegments, size_t maxSegments) const;
        Field* findField(int node, const char* pFieldName);
        const Field* findField(int node, const char* pFieldName) const;
        bool parseLine(char* pLine);
        bool loadOpenFile(FILE* pFile, const char* pFilename);
        static bool matchSegments(const char* const* ppPattern, size_t patternCount,
                                  const char* const* ppPath, size_t pathCount);
        static size_t splitPattern(char* pPattern, const char** ppSegments, size_t maxSegments);

        Node   m_nodes[MAX_CONFIG_NODES];
        Field  m_fields[MAX_CONFIG_FIELDS];
        size_t m_nodeCount = 0;
        size_t m_fieldCount = 0;
};

#endif // CONFIG_TREE_H_
